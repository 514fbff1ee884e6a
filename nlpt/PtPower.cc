#include "nlpt/PtPower.h"
#include "nlpt/AbsPowerCosmology.h"
#include "nlpt/CorrelatorBundles.h"
#include "nlpt/PowerGrid.h"
#include "nlpt/PowerSpectrum2D.h"
#include "nlpt/PtCalculator.h"
#include "nlpt/PtCombinations.h"
#include "nlpt/PtTracer.h"
#include "nlpt/RuntimeError.h"

#include <cmath>

namespace local = nlpt;

local::PtPowerOptions::PtPowerOptions()
: subtractLowK(false), useNonlinear(true), extrapOrderLoK(1), extrapOrderHiK(2),
returnIaBB(false)
{ }

local::PowerSpectrum2DCPtr local::getPtPower2D(AbsPowerCosmology const &cosmology,
PtTracerCPtr tracer1, PtPowerOptions const &options) {
    PtTracerCPtr tracer2 = options.tracer2 ? options.tracer2 : tracer1;
    if(!tracer1 || !tracer2) {
        throw TypeError("getPtPower2D: missing tracer.");
    }
    PtCalculatorPtr calculator = options.calculator;
    if(!calculator) calculator.reset(new PtCalculator());
    // Check that the calculator is configured for our tracers before doing any work.
    PtTracer::Type type1(tracer1->getType()), type2(tracer2->getType());
    if((type1 == PtTracer::NumberCounts || type2 == PtTracer::NumberCounts)
    && !calculator->hasNumberCounts()) {
        throw ValueError("getPtPower2D: calculator is not configured for number counts.");
    }
    if((type1 == PtTracer::IntrinsicAlignment || type2 == PtTracer::IntrinsicAlignment)
    && !calculator->hasIntrinsicAlignment()) {
        throw ValueError("getPtPower2D: calculator is not configured for intrinsic alignments.");
    }
    std::vector<double> a = options.scaleFactors.empty() ?
        cosmology.getDefaultScaleFactors() : options.scaleFactors;
    std::size_t na(a.size());
    if(0 == na) {
        throw ValueError("getPtPower2D: no scale factors.");
    }
    std::vector<double> z;
    z.reserve(na);
    for(std::size_t ia = 0; ia < na; ++ia) {
        if(a[ia] <= 0) {
            throw ValueError("getPtPower2D: scale factors must be positive.");
        }
        z.push_back(1/a[ia] - 1);
    }
    // Refresh the correlators using the present-day linear power.
    std::vector<double> const &k = calculator->getWavenumbers();
    std::size_t nk(k.size());
    CorrelatorBundlesCPtr bundles = calculator->updatePower(cosmology.getLinearPower(k,1.));
    std::vector<double> growth4;
    growth4.reserve(na);
    for(std::size_t ia = 0; ia < na; ++ia) {
        double growth = cosmology.getGrowthFactor(a[ia]);
        double growth2 = growth*growth;
        growth4.push_back(growth2*growth2);
    }
    PowerGrid Pd1d1(nk,na);
    for(std::size_t ia = 0; ia < na; ++ia) {
        std::vector<double> pk = options.useNonlinear ?
            cosmology.getNonlinearPower(k,a[ia]) : cosmology.getLinearPower(k,a[ia]);
        for(std::size_t ik = 0; ik < nk; ++ik) Pd1d1(ik,ia) = pk[ik];
    }
    PowerGrid power;
    switch(type1) {
        case PtTracer::NumberCounts:
        switch(type2) {
            case PtTracer::NumberCounts:
            power = getGalaxyGalaxyPower(*bundles,tracer1->getNumberCountsBias(z),
                tracer2->getNumberCountsBias(z),growth4,Pd1d1,options.subtractLowK);
            break;
            case PtTracer::IntrinsicAlignment:
            power = getGalaxyAlignmentPower(*bundles,tracer1->getNumberCountsBias(z),
                tracer2->getAlignmentBias(z),growth4,Pd1d1);
            break;
            case PtTracer::Matter:
            power = getGalaxyMatterPower(*bundles,tracer1->getNumberCountsBias(z),growth4,Pd1d1);
            break;
            default:
            throw NotImplementedError("getPtPower2D: tracer combination not implemented.");
        }
        break;
        case PtTracer::IntrinsicAlignment:
        switch(type2) {
            case PtTracer::NumberCounts:
            power = getGalaxyAlignmentPower(*bundles,tracer2->getNumberCountsBias(z),
                tracer1->getAlignmentBias(z),growth4,Pd1d1);
            break;
            case PtTracer::IntrinsicAlignment:
            power = getAlignmentAlignmentPower(*bundles,tracer1->getAlignmentBias(z),
                tracer2->getAlignmentBias(z),growth4,Pd1d1,options.returnIaBB);
            break;
            case PtTracer::Matter:
            power = getAlignmentMatterPower(*bundles,tracer1->getAlignmentBias(z),growth4,Pd1d1);
            break;
            default:
            throw NotImplementedError("getPtPower2D: tracer combination not implemented.");
        }
        break;
        case PtTracer::Matter:
        switch(type2) {
            case PtTracer::NumberCounts:
            power = getGalaxyMatterPower(*bundles,tracer2->getNumberCountsBias(z),growth4,Pd1d1);
            break;
            case PtTracer::IntrinsicAlignment:
            power = getAlignmentMatterPower(*bundles,tracer2->getAlignmentBias(z),growth4,Pd1d1);
            break;
            case PtTracer::Matter:
            power = getMatterMatterPower(Pd1d1);
            break;
            default:
            throw NotImplementedError("getPtPower2D: tracer combination not implemented.");
        }
        break;
        default:
        throw NotImplementedError("getPtPower2D: tracer combination not implemented.");
    }
    std::vector<double> lnk;
    lnk.reserve(nk);
    for(std::size_t ik = 0; ik < nk; ++ik) lnk.push_back(std::log(k[ik]));
    PowerSpectrum2DCPtr result(new PowerSpectrum2D(a,lnk,power.getTransposedValues(),false,
        options.extrapOrderLoK,options.extrapOrderHiK));
    return result;
}
