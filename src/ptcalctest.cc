// Checks the wavenumber grid, configuration validation and correlator caching of
// PtCalculator, using an engine that returns simple functions of the input power.

#include "nlpt/nlpt.h"
#include "config.h"

#include <iostream>
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

// Returns (t+1)*P(k) for the t-th correlator of each group and counts its calls.
class ScalingEngine : public nlpt::AbsCorrelatorEngine {
public:
    ScalingEngine(std::vector<double> const &k, int terms)
    : nlpt::AbsCorrelatorEngine(k,terms), calls(0) { }
    virtual nlpt::CorrelatorTerms getDensityBiasTerms(std::vector<double> const &pk) const {
        checkPower(pk,"ScalingEngine::getDensityBiasTerms");
        return scale(pk,nlpt::NumDensityBiasTerms);
    }
    virtual nlpt::CorrelatorTerms getTidalAlignmentTerms(std::vector<double> const &pk) const {
        checkPower(pk,"ScalingEngine::getTidalAlignmentTerms");
        return scale(pk,nlpt::NumTidalAlignmentTerms);
    }
    virtual nlpt::CorrelatorTerms getTidalTorquingTerms(std::vector<double> const &pk) const {
        checkPower(pk,"ScalingEngine::getTidalTorquingTerms");
        return scale(pk,nlpt::NumTidalTorquingTerms);
    }
    virtual nlpt::CorrelatorTerms getMixedAlignmentTerms(std::vector<double> const &pk) const {
        checkPower(pk,"ScalingEngine::getMixedAlignmentTerms");
        return scale(pk,nlpt::NumMixedAlignmentTerms);
    }
    mutable int calls;
private:
    nlpt::CorrelatorTerms scale(std::vector<double> const &pk, int n) const {
        ++calls;
        nlpt::CorrelatorTerms terms(n,pk);
        for(int t = 0; t < n; ++t) {
            for(std::size_t ik = 0; ik < pk.size(); ++ik) terms[t][ik] *= t+1;
        }
        return terms;
    }
};

int main(int argc, char **argv) {

    // Default grid covers 1e-4 to 1e2 with 20 samples per decade.
    std::vector<double> k = nlpt::createWavenumberGrid(-4,2,20);
    check(k.size() == 120,"default grid size");
    check(std::fabs(k.front()/1e-4 - 1) < 1e-12,"default grid kmin");
    check(std::fabs(k.back()/1e2 - 1) < 1e-12,"default grid kmax");
    for(std::size_t i = 1; i < k.size(); ++i) check(k[i] > k[i-1],"grid increasing");

    nlpt::CalculatorConfig config;
    config.log10kMin = -3;
    config.log10kMax = 1;
    config.nkPerDecade = 10;
    config.withIntrinsicAlignment = false;
    std::vector<double> grid = nlpt::createWavenumberGrid(-3,1,10);
    int ncTerms(nlpt::AbsCorrelatorEngine::OneLoopDensity | nlpt::AbsCorrelatorEngine::DensityBias);
    int allTerms(ncTerms | nlpt::AbsCorrelatorEngine::IntrinsicAlignment);

    // Invalid configurations are rejected.
    {
        nlpt::CalculatorConfig bad(config);
        bad.log10kMax = bad.log10kMin;
        try {
            nlpt::PtCalculator calc(bad,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,ncTerms)));
            check(false,"empty k range should throw");
        }
        catch(nlpt::ValueError const &e) { }
        bad = config;
        bad.nkPerDecade = 0.1;
        try {
            nlpt::PtCalculator calc(bad,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,ncTerms)));
            check(false,"single sample grid should throw");
        }
        catch(nlpt::ValueError const &e) { }
        bad = config;
        bad.lowExtrap = -2;
        try {
            nlpt::PtCalculator calc(bad,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,ncTerms)));
            check(false,"extrapolation inside grid should throw");
        }
        catch(nlpt::ValueError const &e) { }
        bad = config;
        bad.windowSmoothing = 1.5;
        try {
            nlpt::PtCalculator calc(bad,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,ncTerms)));
            check(false,"window smoothing > 1 should throw");
        }
        catch(nlpt::ValueError const &e) { }
    }

    // An injected engine must match the grid and provide the configured terms.
    try {
        nlpt::PtCalculator calc(config,nlpt::AbsCorrelatorEnginePtr(
            new ScalingEngine(nlpt::createWavenumberGrid(-3,1,11),ncTerms)));
        check(false,"mismatched engine grid should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        nlpt::CalculatorConfig withIA(config);
        withIA.withIntrinsicAlignment = true;
        nlpt::PtCalculator calc(withIA,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,ncTerms)));
        check(false,"engine without ia terms should throw");
    }
    catch(nlpt::ValueError const &e) { }

    // Number counts only calculator.
    boost::shared_ptr<ScalingEngine> engine(new ScalingEngine(grid,ncTerms));
    nlpt::PtCalculator calc(config,engine);
    check(calc.getNK() == 40,"calculator grid size");
    check(calc.getWavenumbers() == grid,"calculator grid");
    check(calc.hasNumberCounts() && !calc.hasIntrinsicAlignment(),"calculator flags");
    check(!calc.getBundles(),"no bundles before update");

    std::vector<double> shortPower(grid.size()-1,1.);
    try {
        calc.updatePower(shortPower);
        check(false,"short power should throw");
    }
    catch(nlpt::ShapeError const &e) { }
    check(!calc.getBundles(),"no bundles after failed update");
    check(engine->calls == 0,"no engine calls after failed update");

    std::vector<double> power(grid.size());
    for(std::size_t ik = 0; ik < grid.size(); ++ik) power[ik] = 1/(1 + grid[ik]);
    nlpt::CorrelatorBundlesCPtr bundles = calc.updatePower(power);
    check(bundles == calc.getBundles(),"update returns current bundles");
    check(bundles->hasDensityBias() && !bundles->hasIntrinsicAlignment(),"nc bundles only");
    check(engine->calls == 1,"one engine call for nc");
    check(bundles->getDensityBias(nlpt::Pd2d2)[5] == 4*power[5],"density bias values");

    // A failed refresh leaves the previous bundles in place.
    try {
        calc.updatePower(shortPower);
        check(false,"short power should throw again");
    }
    catch(nlpt::ShapeError const &e) { }
    check(calc.getBundles() == bundles,"bundles unchanged after failed update");

    // A new refresh publishes new bundles without touching the old ones.
    std::vector<double> doubled(power);
    for(std::size_t ik = 0; ik < doubled.size(); ++ik) doubled[ik] *= 2;
    nlpt::CorrelatorBundlesCPtr next = calc.updatePower(doubled);
    check(next != bundles,"new bundles published");
    check(bundles->getDensityBias(nlpt::OneLoop)[0] == power[0],"old bundles unchanged");
    check(next->getDensityBias(nlpt::OneLoop)[0] == doubled[0],"new bundles updated");

    // Calculator with both groups uses four engine calls per refresh.
    nlpt::CalculatorConfig both(config);
    both.withIntrinsicAlignment = true;
    boost::shared_ptr<ScalingEngine> engine2(new ScalingEngine(grid,allTerms));
    nlpt::PtCalculator calc2(both,engine2);
    nlpt::CorrelatorBundlesCPtr full = calc2.updatePower(power);
    check(engine2->calls == 4,"four engine calls");
    check(full->hasDensityBias() && full->hasIntrinsicAlignment(),"all bundles");
    check(full->getMixedAlignment(nlpt::D0BB2)[3] == 4*power[3],"mixed alignment values");

    // Intrinsic alignments only.
    nlpt::CalculatorConfig iaOnly(both);
    iaOnly.withNumberCounts = false;
    nlpt::PtCalculator calc3(iaOnly,nlpt::AbsCorrelatorEnginePtr(new ScalingEngine(grid,allTerms)));
    nlpt::CorrelatorBundlesCPtr ia = calc3.updatePower(power);
    check(!ia->hasDensityBias() && ia->hasIntrinsicAlignment(),"ia bundles only");
    try {
        ia->getDensityBias(nlpt::Sigma4);
        check(false,"missing density bias should throw");
    }
    catch(nlpt::ValueError const &e) { }

    // The default engine needs FFTW3.
#ifdef HAVE_LIBFFTW3
    nlpt::PtCalculator defaultEngine(config);
    check(defaultEngine.getNK() == 40,"default engine grid");
#else
    try {
        nlpt::PtCalculator defaultEngine(config);
        check(false,"default engine without FFTW3 should throw");
    }
    catch(nlpt::RuntimeError const &e) { }
#endif

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
