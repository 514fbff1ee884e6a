#include "nlpt/PtCalculator.h"
#include "nlpt/CorrelatorBundles.h"
#include "nlpt/QuadratureCorrelatorEngine.h"
#include "nlpt/RuntimeError.h"

#include "boost/format.hpp"

#include <cmath>
#include <iostream>

namespace local = nlpt;

local::CalculatorConfig::CalculatorConfig()
: withNumberCounts(true), withIntrinsicAlignment(true), log10kMin(-4), log10kMax(2),
nkPerDecade(20), padFactor(1), lowExtrap(-5), highExtrap(3), windowSmoothing(0.75),
nMu(32), nPhi(8), verbose(false)
{ }

std::vector<double> local::createWavenumberGrid(double log10kMin, double log10kMax,
double nkPerDecade) {
    if(log10kMax <= log10kMin) {
        throw ValueError("createWavenumberGrid: expected log10kMin < log10kMax.");
    }
    if(nkPerDecade <= 0) {
        throw ValueError("createWavenumberGrid: expected nkPerDecade > 0.");
    }
    int nk = (int)((log10kMax - log10kMin)*nkPerDecade);
    if(nk < 2) {
        throw ValueError("createWavenumberGrid: grid needs at least 2 samples.");
    }
    std::vector<double> k;
    k.reserve(nk);
    double dlog10k = (log10kMax - log10kMin)/(nk - 1);
    for(int i = 0; i < nk; ++i) {
        k.push_back(std::pow(10.,log10kMin + i*dlog10k));
    }
    return k;
}

local::PtCalculator::PtCalculator(CalculatorConfig const &config, AbsCorrelatorEnginePtr engine)
: _config(config), _engine(engine)
{
    _k = createWavenumberGrid(config.log10kMin,config.log10kMax,config.nkPerDecade);
    if(config.lowExtrap > config.log10kMin || config.highExtrap < config.log10kMax) {
        throw ValueError("PtCalculator: extrapolation range must enclose the wavenumber grid.");
    }
    if(config.windowSmoothing < 0 || config.windowSmoothing > 1) {
        throw ValueError("PtCalculator: expected 0 <= windowSmoothing <= 1.");
    }
    if(config.padFactor < 0) {
        throw ValueError("PtCalculator: expected padFactor >= 0.");
    }
    int terms(AbsCorrelatorEngine::OneLoopDensity);
    if(config.withNumberCounts) terms |= AbsCorrelatorEngine::DensityBias;
    if(config.withIntrinsicAlignment) terms |= AbsCorrelatorEngine::IntrinsicAlignment;
    if(!_engine) {
        _engine.reset(new QuadratureCorrelatorEngine(_k,terms,config.padFactor,
            config.lowExtrap,config.highExtrap,config.windowTaper,config.windowSmoothing,
            config.nMu,config.nPhi,config.verbose));
    }
    else {
        if(_engine->getWavenumbers() != _k) {
            throw ValueError("PtCalculator: engine uses a different wavenumber grid.");
        }
        if(!_engine->hasTerms(terms)) {
            throw ValueError("PtCalculator: engine does not provide the configured terms.");
        }
    }
    if(config.verbose) {
        std::cout << boost::format("PtCalculator: using %d wavenumbers covering %g <= k <= %g")
            % _k.size() % _k.front() % _k.back() << std::endl;
        std::cout << "PtCalculator: number counts " << (config.withNumberCounts ? "on" : "off")
            << ", intrinsic alignments " << (config.withIntrinsicAlignment ? "on" : "off")
            << std::endl;
    }
}

local::PtCalculator::~PtCalculator() { }

local::CorrelatorBundlesCPtr local::PtCalculator::updatePower(
std::vector<double> const &linearPower) {
    if(linearPower.size() != _k.size()) {
        throw ShapeError(boost::str(boost::format(
            "PtCalculator::updatePower: expected %d samples but got %d.")
            % _k.size() % linearPower.size()));
    }
    // Compute everything before replacing the current bundles.
    CorrelatorTerms densityBias, tidalAlignment, tidalTorquing, mixedAlignment;
    if(_config.withNumberCounts) {
        densityBias = _engine->getDensityBiasTerms(linearPower);
    }
    if(_config.withIntrinsicAlignment) {
        tidalAlignment = _engine->getTidalAlignmentTerms(linearPower);
        tidalTorquing = _engine->getTidalTorquingTerms(linearPower);
        mixedAlignment = _engine->getMixedAlignmentTerms(linearPower);
    }
    CorrelatorBundlesCPtr bundles(new CorrelatorBundles(_k.size(),
        densityBias,tidalAlignment,tidalTorquing,mixedAlignment));
    _bundles = bundles;
    if(_config.verbose) {
        std::cout << "PtCalculator: updated correlators." << std::endl;
    }
    return _bundles;
}
