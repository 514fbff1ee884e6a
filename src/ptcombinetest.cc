// Checks the formulas that combine correlators and biases into tracer power spectra.

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

// Fills a group of n correlators sampled at nk wavenumbers with distinct values.
nlpt::CorrelatorTerms createTerms(int n, int nk, double offset) {
    nlpt::CorrelatorTerms terms(n,std::vector<double>(nk));
    for(int t = 0; t < n; ++t) {
        for(int ik = 0; ik < nk; ++ik) terms[t][ik] = offset + 0.1*t + 0.01*ik;
    }
    return terms;
}

nlpt::NumberCountsBias createNumberCountsBias(int nz, double b1, double b2, double bs) {
    nlpt::NumberCountsBias bias;
    for(int iz = 0; iz < nz; ++iz) {
        bias.b1.push_back(b1 + 0.1*iz);
        bias.b2.push_back(b2);
        bias.bs.push_back(bs);
    }
    return bias;
}

nlpt::AlignmentBias createAlignmentBias(int nz, double c1, double c2, double cdelta) {
    nlpt::AlignmentBias bias;
    for(int iz = 0; iz < nz; ++iz) {
        bias.c1.push_back(c1);
        bias.c2.push_back(c2 - 0.2*iz);
        bias.cdelta.push_back(cdelta);
    }
    return bias;
}

int main(int argc, char **argv) {

    int nk(4), nz(3);
    nlpt::CorrelatorTerms density = createTerms(nlpt::NumDensityBiasTerms,nk,1);
    nlpt::CorrelatorTerms ta = createTerms(nlpt::NumTidalAlignmentTerms,nk,2);
    nlpt::CorrelatorTerms tt = createTerms(nlpt::NumTidalTorquingTerms,nk,3);
    nlpt::CorrelatorTerms mix = createTerms(nlpt::NumMixedAlignmentTerms,nk,4);
    nlpt::CorrelatorBundles all(nk,density,ta,tt,mix);
    nlpt::CorrelatorBundles ncOnly(nk,density,nlpt::CorrelatorTerms(),nlpt::CorrelatorTerms(),
        nlpt::CorrelatorTerms());
    check(all.hasDensityBias() && all.hasIntrinsicAlignment(),"all bundles present");
    check(!ncOnly.hasIntrinsicAlignment(),"ia bundles missing");

    std::vector<double> growth4;
    nlpt::PowerGrid Pd1d1(nk,nz);
    for(int iz = 0; iz < nz; ++iz) {
        growth4.push_back(std::pow(1./(1+iz),4));
        for(int ik = 0; ik < nk; ++ik) Pd1d1(ik,iz) = 10 + ik - iz;
    }

    // With b2 = bs = 0, NC x NC reduces to b1^2 Pd1d1 with or without the low-k subtraction.
    nlpt::NumberCountsBias linear = createNumberCountsBias(nz,2,0,0);
    for(int sub = 0; sub < 2; ++sub) {
        nlpt::PowerGrid pgg = nlpt::getGalaxyGalaxyPower(all,linear,linear,growth4,Pd1d1,sub);
        check(pgg.getNK() == (std::size_t)nk && pgg.getNZ() == (std::size_t)nz,"pgg shape");
        for(int iz = 0; iz < nz; ++iz) {
            double b1 = linear.b1[iz];
            for(int ik = 0; ik < nk; ++ik) {
                check(pgg(ik,iz) == b1*b1*Pd1d1(ik,iz),"pgg linear collapse");
            }
        }
    }

    // Full NC x NC with different tracers.
    nlpt::NumberCountsBias bias1 = createNumberCountsBias(nz,1.5,0.4,-0.3);
    nlpt::NumberCountsBias bias2 = createNumberCountsBias(nz,2.5,-0.6,0.2);
    nlpt::PowerGrid pgg = nlpt::getGalaxyGalaxyPower(all,bias1,bias2,growth4,Pd1d1,true);
    {
        int ik(2), iz(1);
        double g4(growth4[iz]), s4(g4*density[nlpt::Sigma4][ik]);
        double b11(bias1.b1[iz]), b21(bias1.b2[iz]), bs1(bias1.bs[iz]);
        double b12(bias2.b1[iz]), b22(bias2.b2[iz]), bs2(bias2.bs[iz]);
        double expected = b11*b12*Pd1d1(ik,iz)
            + 0.5*(b11*b22 + b12*b21)*g4*density[nlpt::Pd1d2][ik]
            + 0.25*b21*b22*(g4*density[nlpt::Pd2d2][ik] - 2*s4)
            + 0.5*(b11*bs2 + b12*bs1)*g4*density[nlpt::Pd1s2][ik]
            + 0.25*(b21*bs2 + b22*bs1)*(g4*density[nlpt::Pd2s2][ik] - 4./3.*s4)
            + 0.25*bs1*bs2*(g4*density[nlpt::Ps2s2][ik] - 8./9.*s4);
        checkClose(pgg(ik,iz),expected,1e-12,"pgg full");
    }
    // NC x NC is symmetric under exchange of the tracers.
    nlpt::PowerGrid pggSwap = nlpt::getGalaxyGalaxyPower(all,bias2,bias1,growth4,Pd1d1,true);
    for(int iz = 0; iz < nz; ++iz) {
        for(int ik = 0; ik < nk; ++ik) checkClose(pggSwap(ik,iz),pgg(ik,iz),1e-12,"pgg symmetry");
    }

    // Low-k subtraction removes the k -> 0 limits of the quadratic and tidal terms.
    {
        nlpt::CorrelatorTerms limits(density);
        for(int ik = 0; ik < nk; ++ik) {
            double sigma4 = limits[nlpt::Sigma4][ik];
            limits[nlpt::Pd2d2][ik] = 2*sigma4;
            limits[nlpt::Pd2s2][ik] = 4./3.*sigma4;
            limits[nlpt::Ps2s2][ik] = 8./9.*sigma4;
        }
        nlpt::CorrelatorBundles lowk(nk,limits,nlpt::CorrelatorTerms(),nlpt::CorrelatorTerms(),
            nlpt::CorrelatorTerms());
        nlpt::NumberCountsBias quadratic = createNumberCountsBias(nz,0,1.3,0.7);
        quadratic.b1.assign(nz,0);
        nlpt::PowerGrid sub = nlpt::getGalaxyGalaxyPower(lowk,quadratic,quadratic,growth4,Pd1d1,true);
        for(int iz = 0; iz < nz; ++iz) {
            for(int ik = 0; ik < nk; ++ik) {
                checkClose(sub(ik,iz),0,1e-12,"pgg low-k subtraction");
            }
        }
    }

    // NC x M
    nlpt::PowerGrid pgm = nlpt::getGalaxyMatterPower(all,bias1,growth4,Pd1d1);
    for(int iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]);
        for(int ik = 0; ik < nk; ++ik) {
            double expected = bias1.b1[iz]*Pd1d1(ik,iz) + 0.5*bias1.b2[iz]*g4*density[nlpt::Pd1d2][ik]
                + 0.5*bias1.bs[iz]*g4*density[nlpt::Pd1s2][ik];
            checkClose(pgm(ik,iz),expected,1e-12,"pgm");
        }
    }
    nlpt::PowerGrid pgmLinear = nlpt::getGalaxyMatterPower(all,linear,growth4,Pd1d1);
    check(pgmLinear(1,1) == linear.b1[1]*Pd1d1(1,1),"pgm linear collapse");

    // IA x M
    nlpt::AlignmentBias ia1 = createAlignmentBias(nz,0.8,0.5,1.2);
    nlpt::AlignmentBias ia2 = createAlignmentBias(nz,-0.4,0.3,0.6);
    nlpt::PowerGrid pim = nlpt::getAlignmentMatterPower(all,ia1,growth4,Pd1d1);
    for(int iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]);
        for(int ik = 0; ik < nk; ++ik) {
            double expected = ia1.c1[iz]*Pd1d1(ik,iz)
                + g4*ia1.cdelta[iz]*(ta[nlpt::A00E][ik] + ta[nlpt::C00E][ik])
                + g4*ia1.c2[iz]*(mix[nlpt::A0E2][ik] + mix[nlpt::B0E2][ik]);
            checkClose(pim(ik,iz),expected,1e-12,"pim");
        }
    }

    // NC x IA only uses b1 and warns on every call.
    std::ostringstream warnings;
    nlpt::setWarningStream(warnings);
    nlpt::PowerGrid pgi = nlpt::getGalaxyAlignmentPower(all,bias1,ia1,growth4,Pd1d1);
    std::string first = warnings.str();
    check(first.find("WARNING") != std::string::npos,"pgi warning");
    nlpt::getGalaxyAlignmentPower(all,bias1,ia1,growth4,Pd1d1);
    check(warnings.str().length() == 2*first.length(),"pgi warning repeated");
    nlpt::setWarningStream(std::cerr);
    for(int iz = 0; iz < nz; ++iz) {
        for(int ik = 0; ik < nk; ++ik) {
            checkClose(pgi(ik,iz),bias1.b1[iz]*pim(ik,iz),1e-12,"pgi");
        }
    }

    // IA x IA, E and B modes.
    nlpt::PowerGrid piiE = nlpt::getAlignmentAlignmentPower(all,ia1,ia2,growth4,Pd1d1);
    nlpt::PowerGrid piiB = nlpt::getAlignmentAlignmentPower(all,ia1,ia2,growth4,Pd1d1,true);
    {
        int ik(3), iz(2);
        double g4(growth4[iz]);
        double c11(ia1.c1[iz]), c21(ia1.c2[iz]), cd1(ia1.cdelta[iz]);
        double c12(ia2.c1[iz]), c22(ia2.c2[iz]), cd2(ia2.cdelta[iz]);
        double expectedE = c11*c12*g4*Pd1d1(ik,iz)
            + (c11*cd2 + c12*cd1)*g4*(ta[nlpt::A00E][ik] + ta[nlpt::C00E][ik])
            + cd1*cd2*g4*ta[nlpt::A0E0E][ik]
            + c21*c22*g4*tt[nlpt::AE2E2][ik]
            + (c11*c22 + c21*c12)*g4*(mix[nlpt::A0E2][ik] + mix[nlpt::B0E2][ik])
            + (cd1*c22 + cd2*c21)*g4*mix[nlpt::D0EE2][ik];
        checkClose(piiE(ik,iz),expectedE,1e-12,"pii E");
        double expectedB = cd1*cd2*ta[nlpt::A0B0B][ik] + cd1*c22*g4*tt[nlpt::AB2B2][ik]
            + (cd1*c22 + cd1*c21)*g4*mix[nlpt::D0BB2][ik];
        checkClose(piiB(ik,iz),expectedB,1e-12,"pii B");
    }

    // M x M is the identity.
    nlpt::PowerGrid pmm = nlpt::getMatterMatterPower(Pd1d1);
    check(pmm.getValues() == Pd1d1.getValues(),"pmm identity");

    // Missing correlators and mismatched shapes are rejected.
    try {
        nlpt::getAlignmentMatterPower(ncOnly,ia1,growth4,Pd1d1);
        check(false,"pim without ia correlators should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        nlpt::getAlignmentAlignmentPower(ncOnly,ia1,ia2,growth4,Pd1d1);
        check(false,"pii without ia correlators should throw");
    }
    catch(nlpt::ValueError const &e) { }
    std::vector<double> shortGrowth(growth4.begin(),growth4.end()-1);
    try {
        nlpt::getGalaxyMatterPower(all,bias1,shortGrowth,Pd1d1);
        check(false,"short growth should throw");
    }
    catch(nlpt::ShapeError const &e) { }
    nlpt::NumberCountsBias shortBias = createNumberCountsBias(nz-1,1,0,0);
    try {
        nlpt::getGalaxyGalaxyPower(all,bias1,shortBias,growth4,Pd1d1,false);
        check(false,"short bias should throw");
    }
    catch(nlpt::ShapeError const &e) { }
    nlpt::PowerGrid wrongK(nk+1,nz);
    try {
        nlpt::getGalaxyMatterPower(all,bias1,growth4,wrongK);
        check(false,"wrong nk should throw");
    }
    catch(nlpt::ShapeError const &e) { }
    try {
        ncOnly.getTidalTorquing(nlpt::AE2E2);
        check(false,"missing torquing terms should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        nlpt::CorrelatorBundles bad(nk+1,density,nlpt::CorrelatorTerms(),nlpt::CorrelatorTerms(),
            nlpt::CorrelatorTerms());
        check(false,"inconsistent bundles should throw");
    }
    catch(nlpt::ShapeError const &e) { }

    // Transposing the grid puts redshift on the slow index.
    std::vector<double> transposed = Pd1d1.getTransposedValues();
    check(transposed[1*nk + 2] == Pd1d1(2,1),"transposed grid");

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
