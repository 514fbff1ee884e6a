#ifndef NLPT_PT_POWER
#define NLPT_PT_POWER

#include "nlpt/types.h"

#include <vector>

namespace nlpt {

    class AbsPowerCosmology;

    // Options for getPtPower2D.
    struct PtPowerOptions {
        PtPowerOptions();
        // Calculator to use. A null pointer selects a calculator with the default configuration.
        PtCalculatorPtr calculator;
        // Second tracer. A null pointer selects an auto-correlation of the first tracer.
        PtTracerCPtr tracer2;
        // Removes the k -> 0 limit of the quadratic and tidal bias terms.
        bool subtractLowK;
        // Uses the nonlinear matter power for the matter x matter contribution, instead
        // of the linear power.
        bool useNonlinear;
        // Scale factors to sample. Empty selects the cosmology's default samples.
        std::vector<double> scaleFactors;
        int extrapOrderLoK, extrapOrderHiK;
        // Returns the B-mode instead of the E-mode power for IA x IA.
        bool returnIaBB;
    };

    // Returns the perturbation-theory power spectrum of tracer1 x tracer2 tabulated on
    // the calculator's wavenumber grid at each of the requested scale factors. The
    // calculator's correlators are refreshed using the linear power at a = 1. Throws
    // a TypeError for a null tracer and a ValueError if the calculator was not
    // configured for the requested tracer types.
    PowerSpectrum2DCPtr getPtPower2D(AbsPowerCosmology const &cosmology, PtTracerCPtr tracer1,
        PtPowerOptions const &options = PtPowerOptions());

} // nlpt

#endif // NLPT_PT_POWER
