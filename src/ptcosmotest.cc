// Checks the tabulated power cosmology: growth, default scale factors and halofit.

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

void checkClose(double value, double expected, double tol, std::string const &what) {
    std::cout << what << " = " << value << " (expected " << expected << ")" << std::endl;
    check(std::fabs(value - expected) <= tol*std::fabs(expected),what);
}

int main(int argc, char **argv) {

    // Toy linear power with P ~ k at low k and P ~ k^-2 at high k.
    std::vector<double> k, Pk;
    int nk(200);
    for(int i = 0; i < nk; ++i) {
        double kval = std::pow(10,-5 + 8.*i/(nk-1.));
        k.push_back(kval);
        Pk.push_back(1e6*kval/std::pow(1 + (kval/0.02)*(kval/0.02),1.5));
    }
    nlpt::TabulatedPowerCPtr power(new nlpt::TabulatedPower(k,Pk));
    checkClose((*power)(k[17]),Pk[17],1e-10,"tabulated node");
    checkClose((*power)(1e-6),0.1*(*power)(1e-5),1e-3,"extrapolation below");
    check((*power)(0) == 0,"P(0) = 0");

    // Einstein-de Sitter has D(a) = a.
    nlpt::TabulatedPowerCosmology eds(power,1,0);
    checkClose(eds.getCurvature(),0,1e-12,"EdS curvature");
    checkClose(eds.getGrowthFactor(1),1,1e-12,"EdS D(1)");
    checkClose(eds.getGrowthFactor(0.5),0.5,1e-4,"EdS D(0.5)");
    checkClose(eds.getGrowthFactor(0.1),0.1,1e-4,"EdS D(0.1)");
    checkClose(eds.getLinearPower(0.1,0.5),0.25*(*power)(0.1),1e-4,"EdS linear power");
    checkClose(eds.getHubbleFunction(3),8,1e-12,"EdS H(z=3)");

    // Growth is suppressed by a cosmological constant.
    nlpt::TabulatedPowerCosmology lcdm(power,0.3,0.7);
    double growth = lcdm.getGrowthFactor(0.5);
    std::cout << "LCDM D(0.5) = " << growth << std::endl;
    check(growth > 0.55 && growth < 0.7,"LCDM D(0.5)");
    checkClose(lcdm.getOmegaMatter(1),0.3,1e-12,"LCDM OmegaMatter(1)");
    check(lcdm.getOmegaMatter(0.5) > 0.3,"LCDM OmegaMatter(0.5)");

    std::vector<double> a = lcdm.getDefaultScaleFactors();
    check(a.size() == 51,"default scale factor count");
    checkClose(a.front(),0.01,1e-12,"first default scale factor");
    check(a.back() == 1,"last default scale factor");
    checkClose(a[11],0.1,1e-12,"first linear default scale factor");
    for(std::size_t i = 1; i < a.size(); ++i) check(a[i] > a[i-1],"increasing scale factors");

    // Halofit is linear on large scales and boosts power on small scales.
    checkClose(lcdm.getNonlinearPower(1e-3,1),lcdm.getLinearPower(1e-3,1),1e-2,
        "halofit at k = 1e-3");
    check(lcdm.getNonlinearPower(10,1) > lcdm.getLinearPower(10,1),"halofit at k = 10");
    std::vector<double> kvec(2,1e-3);
    kvec[1] = 10;
    std::vector<double> pnl = lcdm.getNonlinearPower(kvec,1);
    check(pnl.size() == 2 && pnl[1] == lcdm.getNonlinearPower(10,1),"vector nonlinear power");

    try {
        lcdm.getGrowthFactor(0);
        check(false,"a = 0 should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        lcdm.getLinearPower(0.1,1.5);
        check(false,"a > 1 should throw");
    }
    catch(nlpt::ValueError const &e) { }

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
