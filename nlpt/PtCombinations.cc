#include "nlpt/PtCombinations.h"
#include "nlpt/CorrelatorBundles.h"
#include "nlpt/RuntimeError.h"

#include "boost/format.hpp"

#include <iostream>

namespace local = nlpt;

namespace nlpt {
    std::ostream *warningStream(&std::cerr);

    void checkShape(std::size_t nz, std::size_t size, char const *name, char const *method) {
        if(size != nz) {
            throw ShapeError(boost::str(boost::format("%s: %s has %d values (expected %d).")
                % method % name % size % nz));
        }
    }
    // Checks that Pd1d1 matches the bundles and growth4, and returns the number of redshifts.
    std::size_t checkGrid(CorrelatorBundles const &bundles, std::vector<double> const &growth4,
    PowerGrid const &Pd1d1, char const *method) {
        if(Pd1d1.getNK() != bundles.getNK()) {
            throw ShapeError(boost::str(boost::format("%s: Pd1d1 has %d wavenumbers (expected %d).")
                % method % Pd1d1.getNK() % bundles.getNK()));
        }
        checkShape(Pd1d1.getNZ(),growth4.size(),"growth4",method);
        return Pd1d1.getNZ();
    }
    void checkBias(NumberCountsBias const &bias, std::size_t nz, char const *method) {
        checkShape(nz,bias.b1.size(),"b1",method);
        checkShape(nz,bias.b2.size(),"b2",method);
        checkShape(nz,bias.bs.size(),"bs",method);
    }
    void checkBias(AlignmentBias const &bias, std::size_t nz, char const *method) {
        checkShape(nz,bias.c1.size(),"c1",method);
        checkShape(nz,bias.c2.size(),"c2",method);
        checkShape(nz,bias.cdelta.size(),"cdelta",method);
    }
    void checkDensityBias(CorrelatorBundles const &bundles, char const *method) {
        if(!bundles.hasDensityBias()) {
            throw ValueError(boost::str(boost::format(
                "%s: number counts correlators were not computed.") % method));
        }
    }
    void checkAlignment(CorrelatorBundles const &bundles, char const *method) {
        if(!bundles.hasIntrinsicAlignment()) {
            throw ValueError(boost::str(boost::format(
                "%s: intrinsic alignment correlators were not computed.") % method));
        }
    }
} // nlpt

void local::setWarningStream(std::ostream &os) {
    warningStream = &os;
}

std::ostream &local::getWarningStream() {
    return *warningStream;
}

local::PowerGrid local::getGalaxyGalaxyPower(CorrelatorBundles const &bundles,
NumberCountsBias const &bias1, NumberCountsBias const &bias2,
std::vector<double> const &growth4, PowerGrid const &Pd1d1, bool subtractLowK) {
    char const *method = "getGalaxyGalaxyPower";
    checkDensityBias(bundles,method);
    std::size_t nz = checkGrid(bundles,growth4,Pd1d1,method), nk = Pd1d1.getNK();
    checkBias(bias1,nz,method);
    checkBias(bias2,nz,method);
    std::vector<double> const &d1d2 = bundles.getDensityBias(Pd1d2);
    std::vector<double> const &d2d2 = bundles.getDensityBias(Pd2d2);
    std::vector<double> const &d1s2 = bundles.getDensityBias(Pd1s2);
    std::vector<double> const &d2s2 = bundles.getDensityBias(Pd2s2);
    std::vector<double> const &s2s2 = bundles.getDensityBias(Ps2s2);
    std::vector<double> const &sigma4 = bundles.getDensityBias(Sigma4);
    PowerGrid pgg(nk,nz);
    for(std::size_t iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]);
        double b11(bias1.b1[iz]), b21(bias1.b2[iz]), bs1(bias1.bs[iz]);
        double b12(bias2.b1[iz]), b22(bias2.b2[iz]), bs2(bias2.bs[iz]);
        for(std::size_t ik = 0; ik < nk; ++ik) {
            double s4 = subtractLowK ? g4*sigma4[ik] : 0;
            pgg(ik,iz) = (b11*b12)*Pd1d1(ik,iz)
                + 0.5*(b11*b22 + b12*b21)*(g4*d1d2[ik])
                + 0.25*(b21*b22)*(g4*d2d2[ik] - 2*s4)
                + 0.5*(b11*bs2 + b12*bs1)*(g4*d1s2[ik])
                + 0.25*(b21*bs2 + b22*bs1)*(g4*d2s2[ik] - 4./3.*s4)
                + 0.25*(bs1*bs2)*(g4*s2s2[ik] - 8./9.*s4);
        }
    }
    return pgg;
}

local::PowerGrid local::getGalaxyMatterPower(CorrelatorBundles const &bundles,
NumberCountsBias const &bias, std::vector<double> const &growth4, PowerGrid const &Pd1d1) {
    char const *method = "getGalaxyMatterPower";
    checkDensityBias(bundles,method);
    std::size_t nz = checkGrid(bundles,growth4,Pd1d1,method), nk = Pd1d1.getNK();
    checkBias(bias,nz,method);
    std::vector<double> const &d1d2 = bundles.getDensityBias(Pd1d2);
    std::vector<double> const &d1s2 = bundles.getDensityBias(Pd1s2);
    PowerGrid pgm(nk,nz);
    for(std::size_t iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]), b1(bias.b1[iz]), b2(bias.b2[iz]), bs(bias.bs[iz]);
        for(std::size_t ik = 0; ik < nk; ++ik) {
            pgm(ik,iz) = b1*Pd1d1(ik,iz) + 0.5*b2*(g4*d1d2[ik]) + 0.5*bs*(g4*d1s2[ik]);
        }
    }
    return pgm;
}

local::PowerGrid local::getAlignmentMatterPower(CorrelatorBundles const &bundles,
AlignmentBias const &bias, std::vector<double> const &growth4, PowerGrid const &Pd1d1) {
    char const *method = "getAlignmentMatterPower";
    checkAlignment(bundles,method);
    std::size_t nz = checkGrid(bundles,growth4,Pd1d1,method), nk = Pd1d1.getNK();
    checkBias(bias,nz,method);
    std::vector<double> const &a00e = bundles.getTidalAlignment(A00E);
    std::vector<double> const &c00e = bundles.getTidalAlignment(C00E);
    std::vector<double> const &a0e2 = bundles.getMixedAlignment(A0E2);
    std::vector<double> const &b0e2 = bundles.getMixedAlignment(B0E2);
    PowerGrid pim(nk,nz);
    for(std::size_t iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]), c1(bias.c1[iz]), c2(bias.c2[iz]), cd(bias.cdelta[iz]);
        for(std::size_t ik = 0; ik < nk; ++ik) {
            pim(ik,iz) = c1*Pd1d1(ik,iz) + (g4*cd)*(a00e[ik] + c00e[ik])
                + (g4*c2)*(a0e2[ik] + b0e2[ik]);
        }
    }
    return pim;
}

local::PowerGrid local::getGalaxyAlignmentPower(CorrelatorBundles const &bundles,
NumberCountsBias const &ncBias, AlignmentBias const &iaBias,
std::vector<double> const &growth4, PowerGrid const &Pd1d1) {
    char const *method = "getGalaxyAlignmentPower";
    std::size_t nz = checkGrid(bundles,growth4,Pd1d1,method);
    checkBias(ncBias,nz,method);
    PowerGrid pgi = getAlignmentMatterPower(bundles,iaBias,growth4,Pd1d1);
    getWarningStream() << "WARNING: " << method
        << ": number counts x intrinsic alignment power only includes the linear"
        << " number counts bias." << std::endl;
    for(std::size_t iz = 0; iz < nz; ++iz) {
        double b1(ncBias.b1[iz]);
        for(std::size_t ik = 0; ik < pgi.getNK(); ++ik) {
            pgi(ik,iz) *= b1;
        }
    }
    return pgi;
}

local::PowerGrid local::getAlignmentAlignmentPower(CorrelatorBundles const &bundles,
AlignmentBias const &bias1, AlignmentBias const &bias2,
std::vector<double> const &growth4, PowerGrid const &Pd1d1, bool bmode) {
    char const *method = "getAlignmentAlignmentPower";
    checkAlignment(bundles,method);
    std::size_t nz = checkGrid(bundles,growth4,Pd1d1,method), nk = Pd1d1.getNK();
    checkBias(bias1,nz,method);
    checkBias(bias2,nz,method);
    std::vector<double> const &a00e = bundles.getTidalAlignment(A00E);
    std::vector<double> const &c00e = bundles.getTidalAlignment(C00E);
    std::vector<double> const &a0e0e = bundles.getTidalAlignment(A0E0E);
    std::vector<double> const &a0b0b = bundles.getTidalAlignment(A0B0B);
    std::vector<double> const &ae2e2 = bundles.getTidalTorquing(AE2E2);
    std::vector<double> const &ab2b2 = bundles.getTidalTorquing(AB2B2);
    std::vector<double> const &a0e2 = bundles.getMixedAlignment(A0E2);
    std::vector<double> const &b0e2 = bundles.getMixedAlignment(B0E2);
    std::vector<double> const &d0ee2 = bundles.getMixedAlignment(D0EE2);
    std::vector<double> const &d0bb2 = bundles.getMixedAlignment(D0BB2);
    PowerGrid pii(nk,nz);
    for(std::size_t iz = 0; iz < nz; ++iz) {
        double g4(growth4[iz]);
        double c11(bias1.c1[iz]), c21(bias1.c2[iz]), cd1(bias1.cdelta[iz]);
        double c12(bias2.c1[iz]), c22(bias2.c2[iz]), cd2(bias2.cdelta[iz]);
        for(std::size_t ik = 0; ik < nk; ++ik) {
            if(bmode) {
                pii(ik,iz) = (cd1*cd2)*a0b0b[ik] + (cd1*c22*g4)*ab2b2[ik]
                    + ((cd1*c22 + cd1*c21)*g4)*d0bb2[ik];
            }
            else {
                pii(ik,iz) = (c11*c12*g4)*Pd1d1(ik,iz)
                    + ((c11*cd2 + c12*cd1)*g4)*(a00e[ik] + c00e[ik])
                    + (cd1*cd2*g4)*a0e0e[ik]
                    + (c21*c22*g4)*ae2e2[ik]
                    + ((c11*c22 + c21*c12)*g4)*(a0e2[ik] + b0e2[ik])
                    + ((cd1*c22 + cd2*c21)*g4)*d0ee2[ik];
            }
        }
    }
    return pii;
}

local::PowerGrid local::getMatterMatterPower(PowerGrid const &Pd1d1) {
    return Pd1d1;
}
