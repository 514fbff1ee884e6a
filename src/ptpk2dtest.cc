// Checks the interpolation and extrapolation of a tabulated P(k,a).

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
    bool ok = std::fabs(value - expected) <= tol;
    if(!ok) std::cerr << what << " = " << value << " (error = " << value-expected << ")" << std::endl;
    check(ok,what);
}

// A quadratic in ln(k) whose amplitude depends on a.
double model(double lnk, double a) {
    return a*(1 + 2*lnk + 3*lnk*lnk);
}

int main(int argc, char **argv) {

    // Scale factors are deliberately out of order.
    std::vector<double> a, lnk, grid;
    a.push_back(1.0);
    a.push_back(0.5);
    a.push_back(0.25);
    int nk(20);
    for(int ik = 0; ik < nk; ++ik) lnk.push_back(-2 + 0.2*ik);
    for(std::size_t ia = 0; ia < a.size(); ++ia) {
        for(int ik = 0; ik < nk; ++ik) grid.push_back(model(lnk[ik],a[ia]));
    }

    nlpt::PowerSpectrum2D pk(a,lnk,grid);
    check(pk.getNA() == 3 && pk.getNK() == (std::size_t)nk,"shape");
    check(pk.getScaleFactors()[0] == 0.25 && pk.getScaleFactors()[2] == 1.0,"sorted scale factors");
    check(pk.getValue(0,4) == model(lnk[4],0.25),"rows follow sorted scale factors");
    check(!pk.isLogPower(),"linear storage");

    // Nodes are reproduced exactly and rows are interpolated linearly in a.
    for(int ik = 0; ik < nk; ++ik) {
        double k = std::exp(lnk[ik]);
        checkClose(pk(k,1.0),model(lnk[ik],1.0),1e-12,"node a=1");
        checkClose(pk(k,0.5),model(lnk[ik],0.5),1e-12,"node a=0.5");
        checkClose(pk(k,0.75),model(lnk[ik],0.75),1e-12,"between a nodes");
    }

    // Extrapolation in ln(k): order 1 below and order 2 above by default.
    double lnkLo(lnk.front() - 0.5), lnkHi(lnk.back() + 0.5);
    double slopeLo = 2 + 6*lnk.front();
    checkClose(pk(std::exp(lnkLo),1.0),model(lnk.front(),1.0) + slopeLo*(-0.5),1e-9,"order 1 below");
    checkClose(pk(std::exp(lnkHi),1.0),model(lnkHi,1.0),1e-9,"order 2 above");

    nlpt::PowerSpectrum2D pk0(a,lnk,grid,false,0,0);
    checkClose(pk0(std::exp(lnkLo),0.5),model(lnk.front(),0.5),1e-12,"order 0 below");
    checkClose(pk0(std::exp(lnkHi),0.5),model(lnk.back(),0.5),1e-12,"order 0 above");
    nlpt::PowerSpectrum2D pk2(a,lnk,grid,false,2,1);
    checkClose(pk2(std::exp(lnkLo),0.25),model(lnkLo,0.25),1e-9,"order 2 below");
    double slopeHi = 0.25*(2 + 6*lnk.back());
    checkClose(pk2(std::exp(lnkHi),0.25),model(lnk.back(),0.25) + slopeHi*0.5,1e-9,"order 1 above");

    // Log storage returns exp of the interpolated values.
    nlpt::PowerSpectrum2D logpk(a,lnk,grid,true);
    check(logpk.isLogPower(),"log storage");
    checkClose(logpk(std::exp(lnk[7]),1.0),std::exp(model(lnk[7],1.0)),1e-9,"log storage value");

    // Invalid inputs.
    try {
        pk(1,1.5);
        check(false,"a above range should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        pk(1,0.1);
        check(false,"a below range should throw");
    }
    catch(nlpt::ValueError const &e) { }
    try {
        nlpt::PowerSpectrum2D bad(a,lnk,grid,false,3,1);
        check(false,"invalid order should throw");
    }
    catch(nlpt::ValueError const &e) { }
    std::vector<double> duplicate(a);
    duplicate[2] = 1.0;
    try {
        nlpt::PowerSpectrum2D bad(duplicate,lnk,grid);
        check(false,"duplicate a should throw");
    }
    catch(nlpt::ValueError const &e) { }
    std::vector<double> shortGrid(grid.begin(),grid.end()-1);
    try {
        nlpt::PowerSpectrum2D bad(a,lnk,shortGrid);
        check(false,"short grid should throw");
    }
    catch(nlpt::ShapeError const &e) { }

    // A single scale factor can only be evaluated at that scale factor.
    std::vector<double> single(1,0.5), row(grid.begin()+nk,grid.begin()+2*nk);
    nlpt::PowerSpectrum2D one(single,lnk,row);
    checkClose(one(std::exp(lnk[3]),0.5),model(lnk[3],0.5),1e-12,"single a");

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
