#ifndef NLPT_ABS_CORRELATOR_ENGINE
#define NLPT_ABS_CORRELATOR_ENGINE

#include "nlpt/types.h"

#include <vector>

namespace nlpt {
    // Calculates perturbation-theory correlators of a linear power spectrum sampled
    // on a fixed, logarithmically spaced wavenumber grid. Subclasses perform the
    // actual mode-coupling integrals.
	class AbsCorrelatorEngine {
	public:
	    // Bit flags identifying the groups of correlators that an engine is prepared for.
	    enum TermFlags { OneLoopDensity = 1, DensityBias = 2, IntrinsicAlignment = 4 };
	    // Creates a new engine for the specified wavenumbers, which must be positive
	    // and increasing, and a combination of TermFlags.
		AbsCorrelatorEngine(std::vector<double> const &k, int terms);
		virtual ~AbsCorrelatorEngine();
		std::vector<double> const &getWavenumbers() const;
		int getTerms() const;
		bool hasTerms(int flags) const;
		// Returns the 8 density bias correlators P22+P13, Ps, Pd1d2, Pd2d2, Pd1s2,
		// Pd2s2, Ps2s2, sigma4.
        virtual CorrelatorTerms getDensityBiasTerms(std::vector<double> const &pk) const = 0;
        // Returns the 4 tidal alignment correlators a00e, c00e, a0e0e, a0b0b.
        virtual CorrelatorTerms getTidalAlignmentTerms(std::vector<double> const &pk) const = 0;
        // Returns the 2 tidal torquing correlators ae2e2, ab2b2.
        virtual CorrelatorTerms getTidalTorquingTerms(std::vector<double> const &pk) const = 0;
        // Returns the 4 mixed alignment correlators a0e2, b0e2, d0ee2, d0bb2.
        virtual CorrelatorTerms getMixedAlignmentTerms(std::vector<double> const &pk) const = 0;
	protected:
	    // Throws a ShapeError unless pk is sampled on our wavenumber grid.
        void checkPower(std::vector<double> const &pk, char const *method) const;
	    // Throws a ValueError unless this engine was created for the specified terms.
        void checkTerms(int flags, char const *method) const;
	private:
        std::vector<double> _k;
        int _terms;
	}; // AbsCorrelatorEngine

	inline std::vector<double> const &AbsCorrelatorEngine::getWavenumbers() const { return _k; }
	inline int AbsCorrelatorEngine::getTerms() const { return _terms; }
	inline bool AbsCorrelatorEngine::hasTerms(int flags) const {
	    return (_terms & flags) == flags;
	}
} // nlpt

#endif // NLPT_ABS_CORRELATOR_ENGINE
