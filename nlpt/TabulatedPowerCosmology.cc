#include "nlpt/TabulatedPowerCosmology.h"
#include "nlpt/TabulatedPower.h"
#include "nlpt/RuntimeError.h"

#include "likely/Integrator.h"
#include "likely/Interpolator.h"

#include "boost/bind.hpp"

#include <cmath>

namespace local = nlpt;

local::TabulatedPowerCosmology::TabulatedPowerCosmology(TabulatedPowerCPtr power,
double OmegaMatter, double OmegaLambda, double zmax, int nz, double epsAbs)
: _power(power), _OmegaMatter(OmegaMatter), _OmegaLambda(OmegaLambda),
_curvature(1-OmegaMatter-OmegaLambda), _zmax(zmax), _epsAbs(epsAbs), _nz(nz),
_growthNorm(0), _halofitScaleFactor(-1)
{
    if(!power) {
        throw ValueError("TabulatedPowerCosmology: missing linear power.");
    }
    if(OmegaMatter <= 0) {
        throw ValueError("TabulatedPowerCosmology: invalid OmegaMatter <= 0.");
    }
    if(OmegaLambda < 0) {
        throw ValueError("TabulatedPowerCosmology: invalid OmegaLambda < 0.");
    }
    if(zmax <= 0) {
        throw ValueError("TabulatedPowerCosmology: invalid zmax <= 0.");
    }
    if(nz < 3) {
        throw ValueError("TabulatedPowerCosmology: invalid nz < 3.");
    }
}

local::TabulatedPowerCosmology::~TabulatedPowerCosmology() { }

double local::TabulatedPowerCosmology::getHubbleFunction(double z) const {
    if(z < 0) {
        throw ValueError("TabulatedPowerCosmology::getHubbleFunction: z < 0.");
    }
    double ainv(1+z);
    return std::sqrt(_OmegaLambda + ainv*ainv*(_curvature + ainv*_OmegaMatter));
}

double local::TabulatedPowerCosmology::getOmegaMatter(double a) const {
    if(a <= 0 || a > 1) {
        throw ValueError("TabulatedPowerCosmology::getOmegaMatter: expected 0 < a <= 1.");
    }
    double ainv(1/a), hz(getHubbleFunction(ainv-1));
    return _OmegaMatter*ainv*ainv*ainv/(hz*hz);
}

double local::TabulatedPowerCosmology::_growthIntegrand(double z) const {
    double hz(getHubbleFunction(z));
    return (1+z)/(hz*hz*hz);
}

double local::TabulatedPowerCosmology::_unnormalizedGrowth(double z) const {
    if(z > _zmax) {
        throw ValueError("TabulatedPowerCosmology::getGrowthFactor: z > zmax.");
    }
    if(z < 0) {
        throw ValueError("TabulatedPowerCosmology::getGrowthFactor: z < 0.");
    }
    if(!_growthInterpolator) {
        // Tabulate D(z) = H(z) Integral[(1+z')/H(z')^3,{z',z,infinity}] the first time
        // we are called.
        likely::Integrator::IntegrandPtr integrand(new likely::Integrator::Integrand(
            boost::bind(&TabulatedPowerCosmology::_growthIntegrand,this,_1)));
        likely::Integrator integrator(integrand,_epsAbs,0);
        likely::Interpolator::CoordinateValues zValues(_nz), fValues(_nz);
        double dz = _zmax/(_nz-1);
        zValues[_nz-1] = _zmax;
        fValues[_nz-1] = integrator.integrateUp(_zmax);
        for(int i = _nz-2; i >= 0; --i) {
            double z(i*dz);
            zValues[i] = z;
            fValues[i] = fValues[i+1] + integrator.integrateSmooth(z,(i+1)*dz);
        }
        for(int i = 0; i < _nz; ++i) {
            fValues[i] *= getHubbleFunction(zValues[i]);
        }
        _growthNorm = fValues[0];
        _growthInterpolator.reset(new likely::Interpolator(zValues,fValues,"cspline"));
    }
    return (*_growthInterpolator)(z);
}

double local::TabulatedPowerCosmology::getGrowthFactor(double a) const {
    if(a <= 0 || a > 1) {
        throw ValueError("TabulatedPowerCosmology::getGrowthFactor: expected 0 < a <= 1.");
    }
    double growth = _unnormalizedGrowth(1/a-1);
    return growth/_growthNorm;
}

double local::TabulatedPowerCosmology::getLinearPower(double k, double a) const {
    double growth(getGrowthFactor(a));
    return growth*growth*(*_power)(k);
}

double local::TabulatedPowerCosmology::getNonlinearPower(double k, double a) const {
    double plin(getLinearPower(k,a));
    if(a != _halofitScaleFactor) {
        // Halofit parameters depend only on the epoch, so remember the last one used.
        double (TabulatedPowerCosmology::*evaluator)(double,double) const =
            &TabulatedPowerCosmology::getLinearPower;
        Halofit::LinearPower linearPower(boost::bind(evaluator,this,_1,a));
        _halofitParams = _halofit.getParameters(linearPower);
        _halofitScaleFactor = a;
    }
    return _halofit.getPower(k,plin,getOmegaMatter(a),_halofitParams);
}

std::vector<double> local::TabulatedPowerCosmology::getDefaultScaleFactors() const {
    int nlog(11), nlin(40);
    double amin(0.01), amid(0.1), amax(1);
    std::vector<double> a;
    a.reserve(nlog+nlin);
    for(int i = 0; i < nlog; ++i) {
        a.push_back(amin*std::pow(amid/amin,i/double(nlog)));
    }
    for(int i = 0; i < nlin-1; ++i) {
        a.push_back(amid + (amax-amid)*i/(nlin-1.));
    }
    a.push_back(amax);
    return a;
}
