#ifndef NLPT_RUNTIME_ERROR
#define NLPT_RUNTIME_ERROR

#include <stdexcept>
#include <string>

namespace nlpt {
	class RuntimeError : public std::runtime_error {
	public:
		explicit RuntimeError(std::string const &reason);
		virtual ~RuntimeError() throw ();
	private:
	}; // RuntimeError

	// An argument is not of the expected kind (e.g., a missing tracer, or a bias
	// requested from a tracer of the wrong type).
	class TypeError : public RuntimeError {
	public:
		explicit TypeError(std::string const &reason) : RuntimeError(reason) { }
	}; // TypeError

	// An argument has an acceptable type but an unacceptable value, including
	// configurations that do not provide what a calculation needs.
	class ValueError : public RuntimeError {
	public:
		explicit ValueError(std::string const &reason) : RuntimeError(reason) { }
	}; // ValueError

	// Array arguments whose lengths do not match the grid they are sampled on.
	class ShapeError : public RuntimeError {
	public:
		explicit ShapeError(std::string const &reason) : RuntimeError(reason) { }
	}; // ShapeError

	class NotImplementedError : public RuntimeError {
	public:
		explicit NotImplementedError(std::string const &reason) : RuntimeError(reason) { }
	}; // NotImplementedError

	inline RuntimeError::RuntimeError(std::string const &reason)
	: std::runtime_error(reason) { }

    inline RuntimeError::~RuntimeError() throw () { }
} // nlpt

#endif // NLPT_RUNTIME_ERROR
