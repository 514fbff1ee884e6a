#include "nlpt/PowerSpectrum2D.h"
#include "nlpt/RuntimeError.h"

#include "likely/Interpolator.h"

#include "boost/format.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace local = nlpt;

local::PowerSpectrum2D::PowerSpectrum2D(std::vector<double> const &a,
std::vector<double> const &lnk, std::vector<double> const &grid, bool isLogPower,
int extrapOrderLoK, int extrapOrderHiK)
: _lnk(lnk), _isLogPower(isLogPower), _extrapOrderLoK(extrapOrderLoK),
_extrapOrderHiK(extrapOrderHiK)
{
    std::size_t na(a.size()), nk(lnk.size());
    if(na == 0) {
        throw ValueError("PowerSpectrum2D: need at least one scale factor.");
    }
    if(nk < 2) {
        throw ValueError("PowerSpectrum2D: need at least two wavenumbers.");
    }
    if(grid.size() != na*nk) {
        throw ShapeError(boost::str(boost::format(
            "PowerSpectrum2D: grid has %d values (expected %d x %d).") % grid.size() % na % nk));
    }
    if(extrapOrderLoK < 0 || extrapOrderLoK > 2 || extrapOrderHiK < 0 || extrapOrderHiK > 2) {
        throw ValueError("PowerSpectrum2D: extrapolation orders must be 0, 1 or 2.");
    }
    for(std::size_t ik = 1; ik < nk; ++ik) {
        if(lnk[ik] <= lnk[ik-1]) {
            throw ValueError("PowerSpectrum2D: ln(k) values must be increasing.");
        }
    }
    // Sort the scale factors, keeping track of where each row came from.
    std::vector<std::pair<double,std::size_t> > order;
    for(std::size_t ia = 0; ia < na; ++ia) order.push_back(std::make_pair(a[ia],ia));
    std::sort(order.begin(),order.end());
    for(std::size_t ia = 0; ia < na; ++ia) {
        if(ia > 0 && order[ia].first == order[ia-1].first) {
            throw ValueError(boost::str(boost::format(
                "PowerSpectrum2D: duplicate scale factor %g.") % order[ia].first));
        }
        _a.push_back(order[ia].first);
        std::vector<double>::const_iterator begin = grid.begin() + order[ia].second*nk;
        _rows.push_back(std::vector<double>(begin,begin+nk));
    }
    char const *algorithm = (nk < 3) ? "linear" : "cspline";
    double h1(lnk[1]-lnk[0]), h2(nk < 3 ? 0 : lnk[2]-lnk[1]);
    double g1(lnk[nk-1]-lnk[nk-2]), g2(nk < 3 ? 0 : lnk[nk-2]-lnk[nk-3]);
    for(std::size_t ia = 0; ia < na; ++ia) {
        std::vector<double> const &f = _rows[ia];
        _interpolators.push_back(likely::InterpolatorPtr(
            new likely::Interpolator(_lnk,f,algorithm)));
        if(nk < 3) {
            double slope = (f[1]-f[0])/h1;
            _lowSlope.push_back(slope);
            _highSlope.push_back(slope);
            _lowCurvature.push_back(0);
            _highCurvature.push_back(0);
            continue;
        }
        // Three-point Lagrange derivatives at each end of a non-uniform grid.
        _lowSlope.push_back(-(2*h1+h2)/(h1*(h1+h2))*f[0] + (h1+h2)/(h1*h2)*f[1]
            - h1/(h2*(h1+h2))*f[2]);
        _lowCurvature.push_back(2*(f[0]/(h1*(h1+h2)) - f[1]/(h1*h2) + f[2]/(h2*(h1+h2))));
        // At the high end, g1 is the last spacing and g2 the one before it.
        _highSlope.push_back(g1/(g2*(g1+g2))*f[nk-3] - (g1+g2)/(g1*g2)*f[nk-2]
            + (2*g1+g2)/(g1*(g1+g2))*f[nk-1]);
        _highCurvature.push_back(2*(f[nk-3]/(g2*(g1+g2)) - f[nk-2]/(g1*g2)
            + f[nk-1]/(g1*(g1+g2))));
    }
}

local::PowerSpectrum2D::~PowerSpectrum2D() { }

double local::PowerSpectrum2D::_evaluateRow(std::size_t ia, double lnk) const {
    std::vector<double> const &f = _rows[ia];
    if(lnk < _lnk.front()) {
        double d = lnk - _lnk.front(), value = f.front();
        if(_extrapOrderLoK > 0) value += _lowSlope[ia]*d;
        if(_extrapOrderLoK > 1) value += 0.5*_lowCurvature[ia]*d*d;
        return value;
    }
    if(lnk > _lnk.back()) {
        double d = lnk - _lnk.back(), value = f.back();
        if(_extrapOrderHiK > 0) value += _highSlope[ia]*d;
        if(_extrapOrderHiK > 1) value += 0.5*_highCurvature[ia]*d*d;
        return value;
    }
    return (*_interpolators[ia])(lnk);
}

double local::PowerSpectrum2D::getPower(double k, double a) const {
    if(k <= 0) {
        throw ValueError("PowerSpectrum2D::getPower: expected k > 0.");
    }
    if(a < _a.front() || a > _a.back()) {
        throw ValueError(boost::str(boost::format(
            "PowerSpectrum2D::getPower: a = %g outside tabulated range [%g,%g].")
            % a % _a.front() % _a.back()));
    }
    double lnk = std::log(k), value;
    std::vector<double>::const_iterator found = std::lower_bound(_a.begin(),_a.end(),a);
    std::size_t ia = found - _a.begin();
    if(*found == a) {
        value = _evaluateRow(ia,lnk);
    }
    else {
        // a lies strictly between _a[ia-1] and _a[ia]
        double t = (a - _a[ia-1])/(_a[ia] - _a[ia-1]);
        value = (1-t)*_evaluateRow(ia-1,lnk) + t*_evaluateRow(ia,lnk);
    }
    return _isLogPower ? std::exp(value) : value;
}
