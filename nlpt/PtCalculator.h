#ifndef NLPT_PT_CALCULATOR
#define NLPT_PT_CALCULATOR

#include "nlpt/types.h"

#include <vector>

namespace nlpt {

    // Parameters of a perturbation-theory calculator. The wavenumber grid has
    // int((log10kMax-log10kMin)*nkPerDecade) log-spaced samples with both endpoints
    // included. The remaining parameters control how the linear power is extended,
    // padded and filtered before the correlator integrals.
    struct CalculatorConfig {
        CalculatorConfig();
        bool withNumberCounts, withIntrinsicAlignment;
        double log10kMin, log10kMax, nkPerDecade;
        double padFactor, lowExtrap, highExtrap;
        WindowTaper windowTaper;
        double windowSmoothing;
        int nMu, nPhi;
        bool verbose;
    };

    // Caches the perturbation-theory correlators of a linear power spectrum evaluated
    // on a fixed wavenumber grid. The cache is refreshed with updatePower, which
    // either publishes a complete new set of correlators or leaves the previous set
    // unchanged.
	class PtCalculator {
	public:
	    // Creates a new calculator. A null engine selects the default quadrature engine,
	    // which requires FFTW3. An injected engine must use the same wavenumber grid.
		explicit PtCalculator(CalculatorConfig const &config = CalculatorConfig(),
		    AbsCorrelatorEnginePtr engine = AbsCorrelatorEnginePtr());
		virtual ~PtCalculator();
		std::vector<double> const &getWavenumbers() const;
		std::size_t getNK() const;
		CalculatorConfig const &getConfig() const;
		bool hasNumberCounts() const;
		bool hasIntrinsicAlignment() const;
		// Returns the most recently computed correlators, or a null pointer if
		// updatePower has not been called yet.
		CorrelatorBundlesCPtr getBundles() const;
		// Recomputes the correlators for the specified linear power, which must be
		// sampled on our wavenumber grid at a = 1. Throws a ShapeError otherwise.
		CorrelatorBundlesCPtr updatePower(std::vector<double> const &linearPower);
	private:
        CalculatorConfig _config;
        std::vector<double> _k;
        AbsCorrelatorEnginePtr _engine;
        CorrelatorBundlesCPtr _bundles;
	}; // PtCalculator

	inline std::vector<double> const &PtCalculator::getWavenumbers() const { return _k; }
	inline std::size_t PtCalculator::getNK() const { return _k.size(); }
	inline CalculatorConfig const &PtCalculator::getConfig() const { return _config; }
	inline bool PtCalculator::hasNumberCounts() const { return _config.withNumberCounts; }
	inline bool PtCalculator::hasIntrinsicAlignment() const {
	    return _config.withIntrinsicAlignment;
	}
	inline CorrelatorBundlesCPtr PtCalculator::getBundles() const { return _bundles; }

	// Returns the log-spaced wavenumber grid described by a calculator configuration.
	// Throws a ValueError if the grid would have fewer than two samples.
	std::vector<double> createWavenumberGrid(double log10kMin, double log10kMax, double nkPerDecade);
} // nlpt

#endif // NLPT_PT_CALCULATOR
