#include "nlpt/TabulatedPower.h"
#include "nlpt/RuntimeError.h"

#include "likely/Interpolator.h"

#include <cmath>
#include <iostream>
#include <fstream>

namespace local = nlpt;

local::PowerLawExtrapolator::PowerLawExtrapolator(double k1, double P1, double k2, double P2,
double eps) {
    if(k1 <= 0 || k2 <= 0 || k1 == k2) {
        throw RuntimeError("PowerLawExtrapolator: invalid k1,k2.");
    }
    if(std::fabs(P1-P2) < eps) {
        _index = 0;
        _coef = 0.5*(P1+P2);
    }
    else if(P1*P2 <= 0) {
        throw RuntimeError("PowerLawExtrapolator: P1*P2 <= 0.");
    }
    else {
        _index = std::log(P2/P1)/std::log(k2/k1);
        _coef = P1/std::pow(k1,_index);
    }
}

double local::PowerLawExtrapolator::operator()(double k) const {
    return (0 == _index) ? _coef : _coef*std::pow(k,_index);
}

local::TabulatedPower::TabulatedPower(
std::vector<double> const &k, std::vector<double> const &Pk,
bool extrapolateBelow, bool extrapolateAbove, double maxRelError, bool verbose)
: _size(k.size()), _logPower(true)
{
    if(k.size() != Pk.size()) {
        throw ShapeError("TabulatedPower: input vectors have different sizes.");
    }
    if(k.size() < 3) {
        throw ValueError("TabulatedPower: need at least 3 points.");
    }
    likely::Interpolator::CoordinateValues logk, yValues;
    logk.reserve(k.size());
    yValues.reserve(k.size());
    double lastk(0);
    for(std::size_t i = 0; i < k.size(); ++i) {
        if(k[i] <= lastk) {
            throw ValueError("TabulatedPower: invalid input k vector.");
        }
        lastk = k[i];
        logk.push_back(std::log(k[i]));
        if(Pk[i] <= 0) _logPower = false;
    }
    for(std::size_t i = 0; i < Pk.size(); ++i) {
        yValues.push_back(_logPower ? std::log(Pk[i]) : Pk[i]);
    }
    _kmin = k.front();
    _kmax = k.back();
    if(verbose) {
        double samplesPerDecade = k.size()/std::log10(_kmax/_kmin);
        std::cout << "TabulatedPower: using " << k.size() << " points covering "
            << _kmin << " <= k <= " << _kmax << " (" << samplesPerDecade
            << " samples/decade, " << (_logPower ? "log" : "linear") << " interpolation)"
            << std::endl;
    }
    _interpolator.reset(new likely::Interpolator(logk,yValues,"cspline"));
    int n = k.size();
    if(extrapolateBelow) {
        _extrapolateBelow.reset(new PowerLawExtrapolator(k[0],Pk[0],k[2],Pk[2]));
        double P1 = (*_extrapolateBelow)(k[1]);
        double relerr = std::fabs(P1/Pk[1]-1.);
        if(verbose) {
            std::cout << "TabulatedPower: extrapolating below with index "
                << _extrapolateBelow->getIndex() << " (rel. error " << relerr << ")" << std::endl;
        }
        if(std::fabs(P1 - Pk[1]) > 1e-14 && relerr > maxRelError) {
            throw RuntimeError("TabulatedPower: cannot reliably extrapolate below kmin.");
        }
    }
    if(extrapolateAbove) {
        _extrapolateAbove.reset(new PowerLawExtrapolator(k[n-3],Pk[n-3],k[n-1],Pk[n-1]));
        double Pn2 = (*_extrapolateAbove)(k[n-2]);
        double relerr = std::fabs(Pn2/Pk[n-2]-1.);
        if(verbose) {
            std::cout << "TabulatedPower: extrapolating above with index "
                << _extrapolateAbove->getIndex() << " (rel. error " << relerr << ")" << std::endl;
        }
        if(std::fabs(Pn2 - Pk[n-2]) > 1e-14 && relerr > maxRelError) {
            throw RuntimeError("TabulatedPower: cannot reliably extrapolate above kmax.");
        }
    }
}

local::TabulatedPower::~TabulatedPower() { }

double local::TabulatedPower::operator()(double k) const {
    if(k <= 0) return 0;
    if(k < _kmin) {
        if(!_extrapolateBelow) {
            throw RuntimeError("TabulatedPower: extrapolation below kmin not enabled.");
        }
        return (*_extrapolateBelow)(k);
    }
    if(k > _kmax) {
        if(!_extrapolateAbove) {
            throw RuntimeError("TabulatedPower: extrapolation above kmax not enabled.");
        }
        return (*_extrapolateAbove)(k);
    }
    double value = (*_interpolator)(std::log(k));
    return _logPower ? std::exp(value) : value;
}

local::TabulatedPowerCPtr local::createTabulatedPower(std::string const &filename,
bool extrapolateBelow, bool extrapolateAbove, double maxRelError, bool verbose)
{
    std::ifstream input(filename.c_str());
    if(!input.good()) {
        throw RuntimeError("createTabulatedPower: unable to open " + filename);
    }
    std::vector<std::vector<double> > columns(2);
    likely::readVectors(input, columns);
    TabulatedPowerCPtr power(new TabulatedPower(columns[0],columns[1],
        extrapolateBelow,extrapolateAbove,maxRelError,verbose));
    return power;
}
