#ifndef NLPT_TYPES
#define NLPT_TYPES

#include "boost/function.hpp"
#include "boost/smart_ptr.hpp"
#include "boost/optional.hpp"

#include <utility>
#include <vector>

namespace nlpt {

    // Represents a redshift-dependent bias coefficient b(z).
    typedef boost::function<double (double)> BiasFunction;

    // An ordered set of correlator arrays, each sampled on the same wavenumber grid.
    typedef std::vector<std::vector<double> > CorrelatorTerms;

    // Widths, in decades of k, of the tapered regions at the low and high ends
    // of an extended power spectrum table.
    typedef boost::optional<std::pair<double,double> > WindowTaper;

    class PtTracer;
    typedef boost::shared_ptr<const PtTracer> PtTracerCPtr;

    class PtCalculator;
    typedef boost::shared_ptr<PtCalculator> PtCalculatorPtr;

    class CorrelatorBundles;
    typedef boost::shared_ptr<const CorrelatorBundles> CorrelatorBundlesCPtr;

    class AbsCorrelatorEngine;
    typedef boost::shared_ptr<AbsCorrelatorEngine> AbsCorrelatorEnginePtr;

    class AbsPowerCosmology;
    typedef boost::shared_ptr<const AbsPowerCosmology> AbsPowerCosmologyCPtr;

    class TabulatedPower;
    typedef boost::shared_ptr<const TabulatedPower> TabulatedPowerCPtr;

    class PowerSpectrum2D;
    typedef boost::shared_ptr<const PowerSpectrum2D> PowerSpectrum2DCPtr;

} // nlpt

#endif // NLPT_TYPES
