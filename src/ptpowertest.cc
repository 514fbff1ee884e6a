// Checks getPtPower2D end to end using a simple cosmology and an engine that
// records the power it is given.

#include "nlpt/nlpt.h"

#include <iostream>
#include <sstream>
#include <cmath>
#include <string>
#include <vector>

int failures(0);

void check(bool ok, std::string const &what) {
    if(!ok) {
        ++failures;
        std::cerr << "FAILED: " << what << std::endl;
    }
}

void checkClose(double value, double expected, double relTol, std::string const &what) {
    double scale = std::fabs(expected) > 1 ? std::fabs(expected) : 1;
    bool ok = std::fabs(value - expected) <= relTol*scale;
    if(!ok) std::cerr << what << " = " << value << " (error = " << value-expected << ")" << std::endl;
    check(ok,what);
}

// Linear power P(k,a) = D(a)^2 P0(k) with D(a) = a^growthIndex and P0 = amplitude/(1+k).
// The nonlinear power is 1.5 times the linear power.
class PowerLawCosmology : public nlpt::AbsPowerCosmology {
public:
    PowerLawCosmology(double amplitude, double growthIndex, bool flat = false)
    : _amplitude(amplitude), _growthIndex(growthIndex), _flat(flat) { }
    virtual double getLinearPower(double k, double a) const {
        double growth(getGrowthFactor(a));
        return growth*growth*(_flat ? _amplitude : _amplitude/(1+k));
    }
    virtual double getNonlinearPower(double k, double a) const {
        return 1.5*getLinearPower(k,a);
    }
    virtual double getGrowthFactor(double a) const {
        return std::pow(a,_growthIndex);
    }
    virtual std::vector<double> getDefaultScaleFactors() const {
        std::vector<double> a;
        a.push_back(0.25);
        a.push_back(0.5);
        a.push_back(1);
        return a;
    }
    using nlpt::AbsPowerCosmology::getLinearPower;
    using nlpt::AbsPowerCosmology::getNonlinearPower;
private:
    double _amplitude, _growthIndex;
    bool _flat;
};

// Returns the input power scaled by 0.01*(t+1) for the t-th correlator of each group,
// and remembers the last power it was given.
class RecordingEngine : public nlpt::AbsCorrelatorEngine {
public:
    RecordingEngine(std::vector<double> const &k, int terms)
    : nlpt::AbsCorrelatorEngine(k,terms), calls(0) { }
    virtual nlpt::CorrelatorTerms getDensityBiasTerms(std::vector<double> const &pk) const {
        checkPower(pk,"RecordingEngine::getDensityBiasTerms");
        return record(pk,nlpt::NumDensityBiasTerms);
    }
    virtual nlpt::CorrelatorTerms getTidalAlignmentTerms(std::vector<double> const &pk) const {
        checkPower(pk,"RecordingEngine::getTidalAlignmentTerms");
        return record(pk,nlpt::NumTidalAlignmentTerms);
    }
    virtual nlpt::CorrelatorTerms getTidalTorquingTerms(std::vector<double> const &pk) const {
        checkPower(pk,"RecordingEngine::getTidalTorquingTerms");
        return record(pk,nlpt::NumTidalTorquingTerms);
    }
    virtual nlpt::CorrelatorTerms getMixedAlignmentTerms(std::vector<double> const &pk) const {
        checkPower(pk,"RecordingEngine::getMixedAlignmentTerms");
        return record(pk,nlpt::NumMixedAlignmentTerms);
    }
    mutable int calls;
    mutable std::vector<double> last;
private:
    nlpt::CorrelatorTerms record(std::vector<double> const &pk, int n) const {
        ++calls;
        last = pk;
        nlpt::CorrelatorTerms terms(n,pk);
        for(int t = 0; t < n; ++t) {
            for(std::size_t ik = 0; ik < pk.size(); ++ik) terms[t][ik] *= 0.01*(t+1);
        }
        return terms;
    }
};

nlpt::PtCalculatorPtr createCalculator(bool withNC, bool withIA,
boost::shared_ptr<RecordingEngine> &engine) {
    nlpt::CalculatorConfig config;
    config.withNumberCounts = withNC;
    config.withIntrinsicAlignment = withIA;
    config.log10kMin = -3;
    config.log10kMax = 1;
    config.nkPerDecade = 10;
    std::vector<double> k = nlpt::createWavenumberGrid(config.log10kMin,config.log10kMax,
        config.nkPerDecade);
    int terms(nlpt::AbsCorrelatorEngine::OneLoopDensity);
    if(withNC) terms |= nlpt::AbsCorrelatorEngine::DensityBias;
    if(withIA) terms |= nlpt::AbsCorrelatorEngine::IntrinsicAlignment;
    engine.reset(new RecordingEngine(k,terms));
    nlpt::PtCalculatorPtr calculator(new nlpt::PtCalculator(config,engine));
    return calculator;
}

int main(int argc, char **argv) {

    std::ostringstream warnings;
    nlpt::setWarningStream(warnings);
    boost::shared_ptr<RecordingEngine> engine;

    // Flat spectrum P = 1 with b1 = 2 and no higher-order biases gives pgg = 4.
    {
        PowerLawCosmology flat(1,0,true);
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,false,engine);
        options.useNonlinear = false;
        options.scaleFactors.push_back(1);
        nlpt::PtTracerCPtr nc = nlpt::createNumberCountsTracer(nlpt::constantBias(2),
            nlpt::constantBias(0),nlpt::constantBias(0));
        nlpt::PowerSpectrum2DCPtr pgg = nlpt::getPtPower2D(flat,nc,options);
        check(pgg->getNA() == 1 && pgg->getNK() == 40,"pgg shape");
        std::vector<double> const &k = options.calculator->getWavenumbers();
        for(std::size_t ik = 0; ik < k.size(); ++ik) {
            checkClose(pgg->getValue(0,ik),4,1e-12,"pgg = 4");
            checkClose((*pgg)(k[ik],1),4,1e-12,"pgg(k,1) = 4");
        }
    }

    PowerLawCosmology cosmology(100,1);

    // NC x IA needs intrinsic alignment correlators, checked before any computation.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,false,engine);
        nlpt::PtTracerCPtr nc = nlpt::createNumberCountsTracer(nlpt::constantBias(1),
            nlpt::constantBias(0),nlpt::constantBias(0));
        nlpt::PtTracerCPtr ia = nlpt::createIntrinsicAlignmentTracer(nlpt::constantBias(1),
            nlpt::constantBias(0),nlpt::constantBias(0));
        options.tracer2 = ia;
        try {
            nlpt::getPtPower2D(cosmology,nc,options);
            check(false,"NC x IA without ia should throw");
        }
        catch(nlpt::ValueError const &e) { }
        options.tracer2 = nc;
        try {
            nlpt::getPtPower2D(cosmology,ia,options);
            check(false,"IA x NC without ia should throw");
        }
        catch(nlpt::ValueError const &e) { }
        check(engine->calls == 0,"no computation before configuration error");
        check(!options.calculator->getBundles(),"no bundles before configuration error");

        // Number counts need number counts correlators.
        options.calculator = createCalculator(false,true,engine);
        try {
            nlpt::getPtPower2D(cosmology,nc,options);
            check(false,"NC x NC without nc should throw");
        }
        catch(nlpt::ValueError const &e) { }
        check(engine->calls == 0,"no computation before nc configuration error");
    }

    // Missing tracers.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,true,engine);
        try {
            nlpt::getPtPower2D(cosmology,nlpt::PtTracerCPtr(),options);
            check(false,"null tracer should throw");
        }
        catch(nlpt::TypeError const &e) { }
    }

    // M x M reproduces the matter power at every grid k for unsorted scale factors.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,true,engine);
        options.scaleFactors.push_back(1.0);
        options.scaleFactors.push_back(0.5);
        nlpt::PtTracerCPtr m = nlpt::createMatterTracer();
        nlpt::PowerSpectrum2DCPtr pmm = nlpt::getPtPower2D(cosmology,m,options);
        check(pmm->getNA() == 2 && pmm->getNK() == 40,"pmm shape");
        check(pmm->getScaleFactors()[0] == 0.5,"pmm sorted scale factors");
        std::vector<double> const &k = options.calculator->getWavenumbers();
        for(std::size_t ik = 0; ik < k.size(); ++ik) {
            checkClose((*pmm)(k[ik],1.0),cosmology.getNonlinearPower(k[ik],1.0),1e-12,"pmm(k,1)");
            checkClose((*pmm)(k[ik],0.5),cosmology.getNonlinearPower(k[ik],0.5),1e-12,"pmm(k,0.5)");
        }
        // Correlators are refreshed from the linear power at a = 1.
        for(std::size_t ik = 0; ik < k.size(); ++ik) {
            check(engine->last[ik] == cosmology.getLinearPower(k[ik],1.),"linear power at a = 1");
        }
        check(pmm->getExtrapOrderLoK() == 1 && pmm->getExtrapOrderHiK() == 2,"default orders");

        // Linear matter power and the cosmology's default scale factors.
        options.useNonlinear = false;
        options.scaleFactors.clear();
        nlpt::PowerSpectrum2DCPtr plin = nlpt::getPtPower2D(cosmology,m,options);
        check(plin->getNA() == 3,"default scale factors");
        checkClose((*plin)(k[10],0.25),cosmology.getLinearPower(k[10],0.25),1e-12,"linear pmm");
    }

    // NC x IA and IA x NC agree and warn.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,true,engine);
        nlpt::PtTracerCPtr nc = nlpt::createNumberCountsTracer(nlpt::constantBias(1.7),
            nlpt::constantBias(0.3),nlpt::constantBias(-0.2));
        nlpt::PtTracerCPtr ia = nlpt::createIntrinsicAlignmentTracer(nlpt::constantBias(0.9),
            nlpt::constantBias(0.4),nlpt::constantBias(1.1));
        options.tracer2 = ia;
        warnings.str("");
        nlpt::PowerSpectrum2DCPtr pgi = nlpt::getPtPower2D(cosmology,nc,options);
        check(warnings.str().find("WARNING") != std::string::npos,"NC x IA warns");
        options.tracer2 = nc;
        nlpt::PowerSpectrum2DCPtr pig = nlpt::getPtPower2D(cosmology,ia,options);
        check(pgi->getNA() == pig->getNA() && pgi->getNK() == pig->getNK(),"NC x IA shapes");
        for(std::size_t ja = 0; ja < pgi->getNA(); ++ja) {
            for(std::size_t ik = 0; ik < pgi->getNK(); ++ik) {
                check(pgi->getValue(ja,ik) == pig->getValue(ja,ik),"NC x IA symmetry");
            }
        }
        // IA x M equals NC x IA with b1 = 1.
        nlpt::PtTracerCPtr unbiased = nlpt::createNumberCountsTracer(nlpt::constantBias(1),
            nlpt::constantBias(0),nlpt::constantBias(0));
        options.tracer2 = nlpt::createMatterTracer();
        nlpt::PowerSpectrum2DCPtr pim = nlpt::getPtPower2D(cosmology,ia,options);
        options.tracer2 = unbiased;
        nlpt::PowerSpectrum2DCPtr pgi1 = nlpt::getPtPower2D(cosmology,ia,options);
        checkClose(pgi1->getValue(1,5),pim->getValue(1,5),1e-12,"IA x M vs NC(b1=1) x IA");
        // M x IA equals IA x M.
        options.tracer2 = ia;
        nlpt::PowerSpectrum2DCPtr pmi = nlpt::getPtPower2D(cosmology,nlpt::createMatterTracer(),
            options);
        check(pmi->getValue(2,7) == pim->getValue(2,7),"M x IA symmetry");
    }

    // NC x M collapses to b1 Pd1d1 and M x NC matches it.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,false,engine);
        nlpt::PtTracerCPtr nc = nlpt::createNumberCountsTracer(nlpt::constantBias(1.3),
            nlpt::constantBias(0),nlpt::constantBias(0));
        options.tracer2 = nlpt::createMatterTracer();
        nlpt::PowerSpectrum2DCPtr pgm = nlpt::getPtPower2D(cosmology,nc,options);
        options.tracer2 = nc;
        nlpt::PowerSpectrum2DCPtr pmg = nlpt::getPtPower2D(cosmology,nlpt::createMatterTracer(),
            options);
        std::vector<double> const &k = options.calculator->getWavenumbers();
        for(std::size_t ik = 0; ik < k.size(); ++ik) {
            checkClose(pgm->getValue(2,ik),1.3*cosmology.getNonlinearPower(k[ik],1.),1e-12,"pgm");
            check(pmg->getValue(2,ik) == pgm->getValue(2,ik),"M x NC symmetry");
        }
        // Auto-correlation when tracer2 is omitted, with the low-k subtraction.
        options.tracer2.reset();
        options.subtractLowK = true;
        nlpt::PowerSpectrum2DCPtr pgg = nlpt::getPtPower2D(cosmology,nc,options);
        checkClose(pgg->getValue(0,3),1.3*1.3*cosmology.getNonlinearPower(k[3],0.25),1e-12,
            "pgg auto");
    }

    // IA x IA E and B modes differ.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(false,true,engine);
        nlpt::PtTracerCPtr ia = nlpt::createIntrinsicAlignmentTracer(nlpt::constantBias(0.9),
            nlpt::constantBias(0.4),nlpt::constantBias(1.1));
        nlpt::PowerSpectrum2DCPtr ee = nlpt::getPtPower2D(cosmology,ia,options);
        options.returnIaBB = true;
        nlpt::PowerSpectrum2DCPtr bb = nlpt::getPtPower2D(cosmology,ia,options);
        check(ee->getValue(2,4) != bb->getValue(2,4),"E and B modes differ");
    }

    // Invalid extrapolation orders and duplicate scale factors are rejected.
    {
        nlpt::PtPowerOptions options;
        options.calculator = createCalculator(true,true,engine);
        options.extrapOrderHiK = 3;
        try {
            nlpt::getPtPower2D(cosmology,nlpt::createMatterTracer(),options);
            check(false,"invalid extrapolation order should throw");
        }
        catch(nlpt::ValueError const &e) { }
        options.extrapOrderHiK = 2;
        options.scaleFactors.push_back(0.5);
        options.scaleFactors.push_back(0.5);
        try {
            nlpt::getPtPower2D(cosmology,nlpt::createMatterTracer(),options);
            check(false,"duplicate scale factors should throw");
        }
        catch(nlpt::ValueError const &e) { }
    }

    nlpt::setWarningStream(std::cerr);
    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
