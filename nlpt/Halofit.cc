#include "nlpt/Halofit.h"
#include "nlpt/RuntimeError.h"

#include "boost/math/tools/roots.hpp"

#include <cmath>

namespace local = nlpt;

local::Halofit::Halofit(double kmin, double kmax, int nk)
{
    if(kmin <= 0 || kmax <= kmin) {
        throw ValueError("Halofit: invalid k range.");
    }
    if(nk < 3) {
        throw ValueError("Halofit: need nk >= 3.");
    }
    _dlnk = std::log(kmax/kmin)/(nk-1);
    _k.reserve(nk);
    for(int i = 0; i < nk; ++i) {
        _k.push_back(kmin*std::exp(i*_dlnk));
    }
}

local::Halofit::~Halofit() { }

namespace nlpt {
    // Trapezoid rule on a uniform log(k) grid.
    double integrateHalofitGrid(std::vector<double> const &f, double dlnk) {
        double sum(0);
        int n = f.size();
        for(int i = 0; i < n; ++i) {
            sum += (i == 0 || i == n-1) ? 0.5*f[i] : f[i];
        }
        return sum*dlnk;
    }
    // Evaluates sigma^2(R) - 1 for a Gaussian window of radius R = 1/ksigma, as a
    // function of log(ksigma).
    class GaussianVarianceOffset {
    public:
        GaussianVarianceOffset(std::vector<double> const &k, std::vector<double> const &deltaSq,
            double dlnk) : _k(k), _deltaSq(deltaSq), _dlnk(dlnk) { }
        double operator()(double lnksigma) const {
            double R = std::exp(-lnksigma);
            std::vector<double> integrand(_k.size());
            for(std::size_t i = 0; i < _k.size(); ++i) {
                double x = _k[i]*R;
                integrand[i] = _deltaSq[i]*std::exp(-x*x);
            }
            return integrateHalofitGrid(integrand,_dlnk) - 1;
        }
    private:
        std::vector<double> const &_k, &_deltaSq;
        double _dlnk;
    };
} // nlpt

local::Halofit::Parameters local::Halofit::getParameters(LinearPower const &linearPower) const {
    double twopi2(8*std::atan(1)*4*std::atan(1));
    std::vector<double> deltaSq(_k.size());
    for(std::size_t i = 0; i < _k.size(); ++i) {
        double k(_k[i]);
        deltaSq[i] = k*k*k*linearPower(k)/twopi2;
    }
    Parameters params;
    GaussianVarianceOffset offset(_k,deltaSq,_dlnk);
    double lnkLo(std::log(1e-3)), lnkHi(std::log(100.));
    if(offset(lnkHi) < 0) {
        // Nonlinear scale is beyond the range we correct.
        params.linear = true;
        params.ksigma = params.neff = params.curvature = 0;
        return params;
    }
    if(offset(lnkLo) > 0) {
        throw RuntimeError("Halofit::getParameters: nonlinear scale below 1e-3/Mpc.");
    }
    std::pair<double,double> bracket = boost::math::tools::bisect(offset,
        lnkLo, lnkHi, boost::math::tools::eps_tolerance<double>(40));
    double ksigma = std::exp(0.5*(bracket.first + bracket.second));
    // Derivatives of the Gaussian variance with respect to R = 1/ksigma.
    std::vector<double> d1(_k.size()), d2(_k.size());
    for(std::size_t i = 0; i < _k.size(); ++i) {
        double k(_k[i]), x(k/ksigma);
        double W(std::exp(-0.5*x*x)), Wp(-x*W), Wpp((x*x-1)*W);
        d1[i] = deltaSq[i]*2*k*W*Wp;
        d2[i] = deltaSq[i]*2*k*k*(Wp*Wp + W*Wpp);
    }
    double sig2p = integrateHalofitGrid(d1,_dlnk), sig2pp = integrateHalofitGrid(d2,_dlnk);
    params.linear = false;
    params.ksigma = ksigma;
    params.neff = -sig2p/ksigma - 3;
    params.curvature = -sig2p/ksigma + (sig2p*sig2p - sig2pp)/(ksigma*ksigma);
    return params;
}

double local::Halofit::getPower(double k, double linearPower, double OmegaMatter,
Parameters const &params) const {
    if(params.linear || k <= 0) return linearPower;
    double twopi2(8*std::atan(1)*4*std::atan(1));
    double n(params.neff), n2(n*n), n3(n2*n), C(params.curvature);

    double f1 = std::pow(OmegaMatter,-0.0307);
    double f2 = std::pow(OmegaMatter,-0.0585);
    double f3 = std::pow(OmegaMatter,0.0743);

    double alpha = 1.38848 + 0.3701*n - 0.1452*n2;
    double beta = 0.8291 + 0.9854*n + 0.3400*n2;
    double gamma = 1.18075 + 0.2224*n - 0.6719*C;
    double an = std::pow(10., 1.4861 + 1.83693*n + 1.67618*n2 + 0.7940*n3
        + 0.1670756*n2*n2 - 0.620695*C);
    double bn = std::pow(10., 0.9463 + 0.9466*n + 0.3084*n2 - 0.940*C);
    double cn = std::pow(10., -0.2807 + 0.6669*n + 0.3214*n2 - 0.0793*C);
    double mun = std::pow(10., -3.54419 + 0.19086*n);
    double nun = std::pow(10., 0.95897 + 1.2857*n);

    double y(k/params.ksigma), fy(0.25*y + 0.125*y*y);
    double deltaSqLin = k*k*k*linearPower/twopi2;
    // Two-halo (quasi-linear) term.
    double deltaSqQ = deltaSqLin*std::pow(1 + deltaSqLin,beta)/(1 + alpha*deltaSqLin)*std::exp(-fy);
    // One-halo term.
    double deltaSqHp = an*std::pow(y,3*f1)/(1 + bn*std::pow(y,f2) + std::pow(cn*f3*y,3-gamma));
    double deltaSqH = deltaSqHp/(1 + mun/y + nun/(y*y));
    return (deltaSqQ + deltaSqH)*twopi2/(k*k*k);
}
