#ifndef NLPT_TABULATED_POWER
#define NLPT_TABULATED_POWER

#include "nlpt/types.h"

#include "likely/types.h"

#include "boost/smart_ptr.hpp"

#include <string>
#include <vector>

namespace nlpt {
	// Performs a power-law extrapolation P(k) = c*k^p using parameters c,p determined
	// from two points (k1,P1) and (k2,P2). If |P1-P2| < eps, then uses a constant
	// extrapolation. Otherwise, if P1*P2 <= 0, throws a RuntimeError.
	class PowerLawExtrapolator {
	public:
		PowerLawExtrapolator(double k1, double P1, double k2, double P2, double eps = 1e-14);
		double operator()(double k) const;
		double getIndex() const;
	private:
		double _index, _coef;
	}; // PowerLawExtrapolator

	inline double PowerLawExtrapolator::getIndex() const { return _index; }

	class TabulatedPower {
	// Represents a linear power spectrum P(k) derived from tabulated values that are
	// (approximately) logarithmically spaced in k. Values inside the table are
	// interpolated with a cubic spline in log(k), applied to log(P) when every
	// tabulated value is positive and to P otherwise. Power-law extrapolation below
	// and above the table can be enabled separately.
	public:
		// Creates a new tabulated power object from vectors of k and P(k) which must
		// have the same size, with k > 0 and strictly increasing. The power-law used
		// below kmin is determined from the first and third points and checked at the
		// second point, and similarly above kmax.
		TabulatedPower(std::vector<double> const &k, std::vector<double> const &Pk,
			bool extrapolateBelow = true, bool extrapolateAbove = true,
			double maxRelError = 1e-2, bool verbose = false);
		virtual ~TabulatedPower();
		// Evaluates P(k) for the specified k. Always returns 0 for k <= 0.
		double operator()(double k) const;
		// Returns the limits of the tabulated range.
		double getKMin() const;
		double getKMax() const;
		int getSize() const;
	private:
		double _kmin, _kmax;
		int _size;
		bool _logPower;
		boost::scoped_ptr<PowerLawExtrapolator> _extrapolateBelow, _extrapolateAbove;
		likely::InterpolatorPtr _interpolator;
	}; // TabulatedPower

	inline double TabulatedPower::getKMin() const { return _kmin; }
	inline double TabulatedPower::getKMax() const { return _kmax; }
	inline int TabulatedPower::getSize() const { return _size; }

	// Creates a new tabulated power object using k and P(k) columns read from the
	// specified filename. Additional options are as described above.
	TabulatedPowerCPtr createTabulatedPower(std::string const &filename,
		bool extrapolateBelow = true, bool extrapolateAbove = true,
		double maxRelError = 1e-2, bool verbose = false);
} // nlpt

#endif // NLPT_TABULATED_POWER
