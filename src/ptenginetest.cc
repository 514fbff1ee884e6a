// Checks the quadrature correlator engine against known limits: quadrature rules,
// the P13 kernel, the filtered power table and the k -> 0 limits of the
// quadratic, tidal and alignment correlators.

#include "nlpt/nlpt.h"

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

void checkRatio(double value, double expected, double tol, std::string const &what) {
    double ratio = value/expected;
    bool ok = std::fabs(ratio - 1) <= tol;
    std::cout << what << " = " << value << " (ratio = " << ratio << ")" << std::endl;
    check(ok,what);
}

int main(int argc, char **argv) {

    // Gauss-Legendre rule integrates polynomials up to degree 2n-1 exactly.
    std::vector<double> x, w;
    nlpt::getGaussLegendreRule(5,x,w);
    double sum0(0), sum4(0), sum9(0);
    for(int i = 0; i < 5; ++i) {
        sum0 += w[i];
        sum4 += w[i]*std::pow(x[i],4);
        sum9 += w[i]*std::pow(x[i],9);
    }
    check(std::fabs(sum0 - 2) < 1e-14,"GL weights");
    check(std::fabs(sum4 - 0.4) < 1e-14,"GL x^4");
    check(std::fabs(sum9) < 1e-14,"GL x^9");

    // P13 kernel series match the direct evaluation where they meet.
    checkRatio(nlpt::getPropagatorKernel(0.0099),nlpt::getPropagatorKernel(0.0101),1e-4,
        "kernel at r = 0.01");
    checkRatio(nlpt::getPropagatorKernel(99.9),nlpt::getPropagatorKernel(100.1),1e-4,
        "kernel at r = 100");
    checkRatio(nlpt::getPropagatorKernel(1),-88,1e-12,"kernel at r = 1");
    checkRatio(nlpt::getPropagatorKernel(1+1e-6),-88,1e-4,"kernel near r = 1");
    checkRatio(nlpt::getPropagatorKernel(1e-4),-168,1e-6,"kernel as r -> 0");
    checkRatio(nlpt::getPropagatorKernel(1e4),-488./5.,1e-6,"kernel as r -> infinity");

    // Power spectrum P(q) = q exp(-4q^2) on a grid covering 1e-3 to 1.
    std::vector<double> k = nlpt::createWavenumberGrid(-3,0,10);
    std::vector<double> pk;
    for(std::size_t ik = 0; ik < k.size(); ++ik) pk.push_back(k[ik]*std::exp(-4*k[ik]*k[ik]));
    int terms(nlpt::AbsCorrelatorEngine::OneLoopDensity | nlpt::AbsCorrelatorEngine::DensityBias
        | nlpt::AbsCorrelatorEngine::IntrinsicAlignment);
    nlpt::QuadratureCorrelatorEngine engine(k,terms,1,-4,1,nlpt::WindowTaper(),0);

    // Without smoothing the table reproduces the input on the grid and is padded with zeros.
    std::vector<double> lnq, table;
    engine.getFilteredPower(pk,lnq,table);
    check((int)table.size() == engine.getTableSize(),"table size");
    check(table.front() == 0 && table.back() == 0,"zero padding");
    int offset(-1);
    for(std::size_t j = 0; j < lnq.size(); ++j) {
        if(std::fabs(lnq[j] - std::log(k[0])) < 1e-10) offset = j;
    }
    check(offset > 0,"grid inside table");
    if(offset > 0) {
        for(std::size_t ik = 0; ik < k.size(); ++ik) {
            check(table[offset+ik] == pk[ik],"table matches input");
        }
        // Power-law extrapolation below the grid, where P is almost linear in q.
        double ratio = table[offset-10]/pk[0], expected = std::exp(lnq[offset-10])/k[0];
        checkRatio(ratio,expected,1e-4,"extrapolation below");
    }

    nlpt::CorrelatorTerms density = engine.getDensityBiasTerms(pk);
    check(density.size() == 8,"density bias terms");
    double sigma4 = engine.getSigma4(pk);
    check(density[nlpt::Sigma4][0] == sigma4 && density[nlpt::Sigma4][20] == sigma4,
        "sigma4 is constant");
    check(density[nlpt::FilteredLinear][5] == pk[5],"filtered linear power");
    checkRatio(density[nlpt::Pd2d2][0],2*sigma4,1e-2,"Pd2d2 -> 2 sigma4");
    checkRatio(density[nlpt::Pd2s2][0],4./3.*sigma4,1e-2,"Pd2s2 -> 4/3 sigma4");
    checkRatio(density[nlpt::Ps2s2][0],8./9.*sigma4,1e-2,"Ps2s2 -> 8/9 sigma4");

    nlpt::CorrelatorTerms ta = engine.getTidalAlignmentTerms(pk);
    check(ta.size() == 4,"tidal alignment terms");
    checkRatio(ta[nlpt::A0E0E][0],8./15.*sigma4,1e-2,"a0e0e -> 8/15 sigma4");
    checkRatio(ta[nlpt::A0B0B][0],8./15.*sigma4,1e-2,"a0b0b -> 8/15 sigma4");
    check(engine.getTidalTorquingTerms(pk).size() == 2,"tidal torquing terms");
    check(engine.getMixedAlignmentTerms(pk).size() == 4,"mixed alignment terms");

    // Input power must be sampled on the grid.
    std::vector<double> shortPower(pk.begin(),pk.end()-1);
    try {
        engine.getDensityBiasTerms(shortPower);
        check(false,"short power should throw");
    }
    catch(nlpt::ShapeError const &e) { }

    // An engine without intrinsic alignment terms refuses to compute them.
    nlpt::QuadratureCorrelatorEngine ncEngine(k,nlpt::AbsCorrelatorEngine::OneLoopDensity
        | nlpt::AbsCorrelatorEngine::DensityBias,1,-4,1);
    try {
        ncEngine.getTidalAlignmentTerms(pk);
        check(false,"unconfigured terms should throw");
    }
    catch(nlpt::ValueError const &e) { }
    // Extrapolation range must enclose the grid.
    try {
        nlpt::QuadratureCorrelatorEngine bad(k,terms,1,-2,1);
        check(false,"extrapolation inside grid should throw");
    }
    catch(nlpt::ValueError const &e) { }

    // Flat spectrum through the default engine: pgg = b1^2 exactly when b2 = bs = 0.
    {
        nlpt::CalculatorConfig config;
        config.log10kMin = -3;
        config.log10kMax = 1;
        config.nkPerDecade = 10;
        config.withIntrinsicAlignment = false;
        config.windowSmoothing = 0;
        nlpt::PtCalculator calc(config);
        std::vector<double> flat(calc.getNK(),1.);
        nlpt::CorrelatorBundlesCPtr bundles = calc.updatePower(flat);
        nlpt::PowerGrid Pd1d1(calc.getNK(),1,1.);
        std::vector<double> growth4(1,1.);
        nlpt::NumberCountsBias bias;
        bias.b1.push_back(2);
        bias.b2.push_back(0);
        bias.bs.push_back(0);
        nlpt::PowerGrid pgg = nlpt::getGalaxyGalaxyPower(*bundles,bias,bias,growth4,Pd1d1,false);
        for(std::size_t ik = 0; ik < calc.getNK(); ++ik) check(pgg(ik,0) == 4,"pgg = 4");
    }

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
