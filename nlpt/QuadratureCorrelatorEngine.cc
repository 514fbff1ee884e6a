#include "nlpt/QuadratureCorrelatorEngine.h"
#include "nlpt/TabulatedPower.h"
#include "nlpt/RuntimeError.h"

#include "likely/Interpolator.h"
#include "likely/types.h"

#include "config.h"
#ifdef HAVE_LIBFFTW3
#include "fftw3.h"
#define FFTW(X) fftw_ ## X // double transforms
#endif

#include <algorithm>
#include <cmath>
#include <iostream>

namespace local = nlpt;

namespace nlpt {
    class QuadratureCorrelatorEngine::Implementation {
    public:
#ifdef HAVE_LIBFFTW3
        double *rdata;
        FFTW(complex) *cdata;
        FFTW(plan) forward, backward;
#endif
    };
    // Extended power table with interpolation in ln(q). Evaluates to zero outside
    // the unpadded range.
    class QuadratureCorrelatorEngine::FilteredTable {
    public:
        std::vector<double> power;
        likely::InterpolatorPtr interpolator;
        double lnqmin, lnqmax;
        double operator()(double lnp) const {
            if(lnp < lnqmin || lnp > lnqmax) return 0;
            return (*interpolator)(lnp);
        }
    };
    // Angular kernels integrated against P(q)P(|k-q|).
    enum ModeCouplingKernel {
        F2F2 = 0, F2, One, F2S2, S2, S2S2, F2DSE, DSE2, DSB2, TE2, TB2, F2TE, DSETE, DSBTB,
        NumModeCouplingKernels
    };
    // Kernels integrated against P(k)P(q).
    enum PropagatorKernel { P13 = 0, C00E, B0E2, NumPropagatorKernels };
    // Returns x - sin(2pi x)/(2pi), which rises smoothly from 0 to 1 on [0,1].
    double windowFunction(double x) {
        static double twopi(2*std::atan2(0,-1));
        return x - std::sin(twopi*x)/twopi;
    }
} // nlpt

local::QuadratureCorrelatorEngine::QuadratureCorrelatorEngine(std::vector<double> const &k,
int terms, double padFactor, double lowExtrap, double highExtrap,
WindowTaper const &windowTaper, double windowSmoothing, int nMu, int nPhi, bool verbose)
: AbsCorrelatorEngine(k,terms), _windowSmoothing(windowSmoothing), _windowTaper(windowTaper),
_nMu(nMu), _nPhi(nPhi), _pimpl(new Implementation())
{
#ifndef HAVE_LIBFFTW3
    throw RuntimeError("QuadratureCorrelatorEngine: package not built with FFTW3.");
#endif
    if(padFactor < 0) {
        throw ValueError("QuadratureCorrelatorEngine: expected padFactor >= 0.");
    }
    if(windowSmoothing < 0 || windowSmoothing > 1) {
        throw ValueError("QuadratureCorrelatorEngine: expected 0 <= windowSmoothing <= 1.");
    }
    if(windowTaper && (windowTaper->first < 0 || windowTaper->second < 0)) {
        throw ValueError("QuadratureCorrelatorEngine: expected windowTaper >= 0.");
    }
    if(nMu < 2) {
        throw ValueError("QuadratureCorrelatorEngine: expected nMu >= 2.");
    }
    if(nPhi < 1) {
        throw ValueError("QuadratureCorrelatorEngine: expected nPhi >= 1.");
    }
    int nk = k.size();
    double ln10(std::log(10.)), lnkmin(std::log(k.front())), lnkmax(std::log(k.back()));
    _dlnk = (lnkmax - lnkmin)/(nk - 1);
    if(lowExtrap*ln10 > lnkmin + 1e-8*_dlnk || highExtrap*ln10 < lnkmax - 1e-8*_dlnk) {
        throw ValueError("QuadratureCorrelatorEngine: extrapolation range does not enclose k grid.");
    }
    _nLow = (int)std::ceil((lnkmin - lowExtrap*ln10)/_dlnk - 1e-8);
    _nHigh = (int)std::ceil((highExtrap*ln10 - lnkmax)/_dlnk - 1e-8);
    if(_nLow < 0) _nLow = 0;
    if(_nHigh < 0) _nHigh = 0;
    _nPad = (int)(padFactor*nk);
    int ntot = nk + _nLow + _nHigh + 2*_nPad;
    _lnq.reserve(ntot);
    for(int j = 0; j < ntot; ++j) {
        _lnq.push_back(lnkmin + (j - _nPad - _nLow)*_dlnk);
    }
    getGaussLegendreRule(nMu,_muNode,_muWeight);
    double twopi(2*std::atan2(0,-1));
    for(int l = 0; l < nPhi; ++l) {
        double phi = twopi*(l + 0.5)/nPhi;
        _cosPhi.push_back(std::cos(phi));
    }
#ifdef HAVE_LIBFFTW3
    _pimpl->rdata = (double*)FFTW(malloc)(sizeof(double)*ntot);
    _pimpl->cdata = (FFTW(complex)*)FFTW(malloc)(sizeof(FFTW(complex))*(ntot/2+1));
    _pimpl->forward = FFTW(plan_dft_r2c_1d)(ntot,_pimpl->rdata,_pimpl->cdata,FFTW_ESTIMATE);
    _pimpl->backward = FFTW(plan_dft_c2r_1d)(ntot,_pimpl->cdata,_pimpl->rdata,FFTW_ESTIMATE);
#endif
    if(verbose) {
        std::cout << "QuadratureCorrelatorEngine: table has " << ntot << " samples ("
            << _nLow << " below, " << _nHigh << " above, " << _nPad << " padding per side) with"
            << " dlnq = " << _dlnk << std::endl;
        std::cout << "QuadratureCorrelatorEngine: integrating with nMu = " << nMu
            << ", nPhi = " << nPhi << std::endl;
    }
}

local::QuadratureCorrelatorEngine::~QuadratureCorrelatorEngine() {
#ifdef HAVE_LIBFFTW3
    FFTW(destroy_plan)(_pimpl->forward);
    FFTW(destroy_plan)(_pimpl->backward);
    FFTW(free)(_pimpl->rdata);
    FFTW(free)(_pimpl->cdata);
#endif
}

void local::QuadratureCorrelatorEngine::_filter(std::vector<double> const &pk,
FilteredTable &table) const {
    std::vector<double> const &k = getWavenumbers();
    int nk = k.size(), ntot = _lnq.size();
    int offset = _nPad + _nLow, first = _nPad, last = ntot - _nPad - 1;
    std::vector<double> &power = table.power;
    power.assign(ntot,0);
    for(int i = 0; i < nk; ++i) power[offset+i] = pk[i];
    // Power-law extrapolation needs positive end points, otherwise extend with zeros.
    if(_nLow > 0 && pk[0] > 0 && pk[1] > 0) {
        PowerLawExtrapolator below(k[0],pk[0],k[1],pk[1],0);
        for(int j = first; j < offset; ++j) power[j] = below(std::exp(_lnq[j]));
    }
    if(_nHigh > 0 && pk[nk-2] > 0 && pk[nk-1] > 0) {
        PowerLawExtrapolator above(k[nk-2],pk[nk-2],k[nk-1],pk[nk-1],0);
        for(int j = offset + nk; j <= last; ++j) power[j] = above(std::exp(_lnq[j]));
    }
    if(_windowTaper) {
        double ln10(std::log(10.));
        double width = _windowTaper->first*ln10;
        if(width > 0) {
            for(int j = first; j <= last; ++j) {
                double x = (_lnq[j] - _lnq[first])/width;
                if(x >= 1) break;
                power[j] *= windowFunction(x);
            }
        }
        width = _windowTaper->second*ln10;
        if(width > 0) {
            for(int j = last; j >= first; --j) {
                double x = (_lnq[last] - _lnq[j])/width;
                if(x >= 1) break;
                power[j] *= windowFunction(x);
            }
        }
    }
    int nyquist = ntot/2;
    int nCut = (int)(_windowSmoothing*nyquist);
    if(nCut > 0) {
#ifdef HAVE_LIBFFTW3
        // Smooth P(q)*q^2, tapering the highest nCut Fourier modes.
        for(int j = 0; j < ntot; ++j) {
            _pimpl->rdata[j] = power[j]*std::exp(2*_lnq[j]);
        }
        FFTW(execute)(_pimpl->forward);
        for(int m = nyquist - nCut + 1; m <= nyquist; ++m) {
            double window = windowFunction((nyquist - m)/(double)nCut);
            _pimpl->cdata[m][0] *= window;
            _pimpl->cdata[m][1] *= window;
        }
        FFTW(execute)(_pimpl->backward);
        for(int j = 0; j < ntot; ++j) {
            power[j] = _pimpl->rdata[j]/ntot*std::exp(-2*_lnq[j]);
        }
#endif
    }
    likely::Interpolator::CoordinateValues lnq(_lnq.begin()+first,_lnq.begin()+last+1),
        values(power.begin()+first,power.begin()+last+1);
    table.interpolator.reset(new likely::Interpolator(lnq,values,"cspline"));
    table.lnqmin = _lnq[first];
    table.lnqmax = _lnq[last];
}

void local::QuadratureCorrelatorEngine::_integrateModeCoupling(FilteredTable const &table,
CorrelatorTerms &result) const {
    std::vector<double> const &k = getWavenumbers();
    int nk = k.size(), first = _nPad, last = (int)_lnq.size() - _nPad - 1;
    double pi(std::atan2(0,-1));
    result.assign(NumModeCouplingKernels,std::vector<double>(nk,0));
    std::vector<double> sum(NumModeCouplingKernels);
    for(int ik = 0; ik < nk; ++ik) {
        double kval(k[ik]);
        std::fill(sum.begin(),sum.end(),0);
        for(int j = first; j <= last; ++j) {
            double Pq = table.power[j];
            if(0 == Pq) continue;
            double q = std::exp(_lnq[j]);
            double weight = (j == first || j == last) ? 0.5*_dlnk : _dlnk;
            weight *= q*q*q*Pq;
            // Integrate over the half q < |k-q| and double, using the q <-> k-q symmetry.
            double mumax = (2*q < kval) ? 1 : kval/(2*q);
            double halfWidth = 0.5*(mumax + 1);
            for(int im = 0; im < _nMu; ++im) {
                double mu = halfWidth*(_muNode[im] + 1) - 1;
                double p2 = kval*kval + q*q - 2*kval*q*mu;
                double p = (p2 > 0) ? std::sqrt(p2) : 0;
                if(p < 1e-300) continue;
                double Pp = table(std::log(p));
                if(0 == Pp) continue;
                double w = weight*halfWidth*_muWeight[im]*Pp;
                double cqp = (kval*mu - q)/p;
                double f2 = 5./7. + 0.5*cqp*(q/p + p/q) + 2./7.*cqp*cqp;
                double s2 = cqp*cqp - 1./3.;
                sum[F2F2] += w*f2*f2;
                sum[F2] += w*f2;
                sum[One] += w;
                sum[F2S2] += w*f2*s2;
                sum[S2] += w*s2;
                sum[S2S2] += w*s2*s2;
                // Tidal projections, with k along x and the line of sight along z.
                double s = std::sqrt(std::max(0.,1 - mu*mu));
                double px = (kval - q*mu)/p;
                double dsE(0), dsE2(0), dsB2(0), tE2(0), tB2(0), tE(0), dsEtE(0), dsBtB(0);
                for(int l = 0; l < _nPhi; ++l) {
                    double qx(mu), qy(s*_cosPhi[l]), py(-q*qy/p);
                    double Eq(qx*qx - qy*qy), Bq(2*qx*qy), Ep(px*px - py*py), Bp(2*px*py);
                    double ddsE = 0.5*(Eq + Ep), ddsB = 0.5*(Bq + Bp);
                    double dtE = cqp*(qx*px - qy*py) - (Eq + Ep)/3;
                    double dtB = cqp*(qx*py + qy*px) - (Bq + Bp)/3;
                    dsE += ddsE;
                    dsE2 += ddsE*ddsE;
                    dsB2 += ddsB*ddsB;
                    tE2 += dtE*dtE;
                    tB2 += dtB*dtB;
                    tE += dtE;
                    dsEtE += ddsE*dtE;
                    dsBtB += ddsB*dtB;
                }
                w /= _nPhi;
                sum[F2DSE] += w*f2*dsE;
                sum[DSE2] += w*dsE2;
                sum[DSB2] += w*dsB2;
                sum[TE2] += w*tE2;
                sum[TB2] += w*tB2;
                sum[F2TE] += w*f2*tE;
                sum[DSETE] += w*dsEtE;
                sum[DSBTB] += w*dsBtB;
            }
        }
        // Each term is 2 Integral[d^3q/(2pi)^3 ...] = (2/4pi^2) Integral[q^3 dlnq dmu <...>_phi]
        // and the half-space integral is doubled.
        for(int t = 0; t < NumModeCouplingKernels; ++t) {
            result[t][ik] = sum[t]/(pi*pi);
        }
    }
}

void local::QuadratureCorrelatorEngine::_integrateOneLoopPropagator(FilteredTable const &table,
bool alignment, CorrelatorTerms &result) const {
    std::vector<double> const &k = getWavenumbers();
    int nk = k.size(), first = _nPad, last = (int)_lnq.size() - _nPad - 1;
    double pi(std::atan2(0,-1));
    result.assign(NumPropagatorKernels,std::vector<double>(nk,0));
    for(int ik = 0; ik < nk; ++ik) {
        double kval(k[ik]), Pk(table.power[_nPad + _nLow + ik]);
        double p13(0), c00e(0), b0e2(0);
        for(int j = first; j <= last; ++j) {
            double Pq = table.power[j];
            if(0 == Pq) continue;
            double q = std::exp(_lnq[j]);
            double dlnq = (j == first || j == last) ? 0.5*_dlnk : _dlnk;
            double r = q/kval;
            p13 += dlnq*r*Pq*getPropagatorKernel(r);
            if(!alignment) continue;
            double weight = dlnq*q*q*q*Pq;
            for(int im = 0; im < _nMu; ++im) {
                double mu = _muNode[im];
                double p2 = kval*kval + q*q - 2*kval*q*mu;
                double p = (p2 > 0) ? std::sqrt(p2) : 0;
                if(p < 1e-300) continue;
                double f2 = 5./7. - 0.5*mu*(kval/q + q/kval) + 2./7.*mu*mu;
                double cqp = (kval*mu - q)/p;
                double s = std::sqrt(std::max(0.,1 - mu*mu));
                double px = (kval - q*mu)/p;
                double sumE(0), tE(0);
                for(int l = 0; l < _nPhi; ++l) {
                    double qx(mu), qy(s*_cosPhi[l]), py(-q*qy/p);
                    double Eq(qx*qx - qy*qy), Ep(px*px - py*py);
                    sumE += Eq + Ep;
                    tE += cqp*(qx*px - qy*py) - (Eq + Ep)/3;
                }
                double w = weight*_muWeight[im]*f2/_nPhi;
                c00e += w*sumE;
                b0e2 += w*tE;
            }
        }
        result[P13][ik] = kval*kval*kval*Pk*p13/(1008*pi*pi);
        result[C00E][ik] = 2*Pk*c00e/(4*pi*pi);
        result[B0E2][ik] = 4*Pk*b0e2/(4*pi*pi);
    }
}

double local::QuadratureCorrelatorEngine::_getSigma4(FilteredTable const &table) const {
    int first = _nPad, last = (int)_lnq.size() - _nPad - 1;
    double pi(std::atan2(0,-1)), sum(0);
    for(int j = first; j <= last; ++j) {
        double q = std::exp(_lnq[j]), Pq = table.power[j];
        double dlnq = (j == first || j == last) ? 0.5*_dlnk : _dlnk;
        sum += dlnq*q*q*q*Pq*Pq;
    }
    return sum/(2*pi*pi);
}

local::CorrelatorTerms
local::QuadratureCorrelatorEngine::getDensityBiasTerms(std::vector<double> const &pk) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getDensityBiasTerms");
    checkTerms(DensityBias,"QuadratureCorrelatorEngine::getDensityBiasTerms");
    FilteredTable table;
    _filter(pk,table);
    CorrelatorTerms coupling, propagator;
    _integrateModeCoupling(table,coupling);
    _integrateOneLoopPropagator(table,false,propagator);
    int nk = pk.size();
    CorrelatorTerms result;
    result.reserve(8);
    std::vector<double> oneLoop(nk), filtered(nk);
    for(int ik = 0; ik < nk; ++ik) {
        oneLoop[ik] = coupling[F2F2][ik] + propagator[P13][ik];
        filtered[ik] = table.power[_nPad + _nLow + ik];
    }
    result.push_back(oneLoop);
    result.push_back(filtered);
    result.push_back(coupling[F2]);
    result.push_back(coupling[One]);
    result.push_back(coupling[F2S2]);
    result.push_back(coupling[S2]);
    result.push_back(coupling[S2S2]);
    result.push_back(std::vector<double>(nk,_getSigma4(table)));
    return result;
}

local::CorrelatorTerms
local::QuadratureCorrelatorEngine::getTidalAlignmentTerms(std::vector<double> const &pk) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getTidalAlignmentTerms");
    checkTerms(IntrinsicAlignment,"QuadratureCorrelatorEngine::getTidalAlignmentTerms");
    FilteredTable table;
    _filter(pk,table);
    CorrelatorTerms coupling, propagator;
    _integrateModeCoupling(table,coupling);
    _integrateOneLoopPropagator(table,true,propagator);
    CorrelatorTerms result;
    result.push_back(coupling[F2DSE]);
    result.push_back(propagator[C00E]);
    result.push_back(coupling[DSE2]);
    result.push_back(coupling[DSB2]);
    return result;
}

local::CorrelatorTerms
local::QuadratureCorrelatorEngine::getTidalTorquingTerms(std::vector<double> const &pk) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getTidalTorquingTerms");
    checkTerms(IntrinsicAlignment,"QuadratureCorrelatorEngine::getTidalTorquingTerms");
    FilteredTable table;
    _filter(pk,table);
    CorrelatorTerms coupling;
    _integrateModeCoupling(table,coupling);
    CorrelatorTerms result;
    result.push_back(coupling[TE2]);
    result.push_back(coupling[TB2]);
    return result;
}

local::CorrelatorTerms
local::QuadratureCorrelatorEngine::getMixedAlignmentTerms(std::vector<double> const &pk) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getMixedAlignmentTerms");
    checkTerms(IntrinsicAlignment,"QuadratureCorrelatorEngine::getMixedAlignmentTerms");
    FilteredTable table;
    _filter(pk,table);
    CorrelatorTerms coupling, propagator;
    _integrateModeCoupling(table,coupling);
    _integrateOneLoopPropagator(table,true,propagator);
    CorrelatorTerms result;
    result.push_back(coupling[F2TE]);
    result.push_back(propagator[B0E2]);
    result.push_back(coupling[DSETE]);
    result.push_back(coupling[DSBTB]);
    return result;
}

void local::QuadratureCorrelatorEngine::getFilteredPower(std::vector<double> const &pk,
std::vector<double> &lnq, std::vector<double> &power) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getFilteredPower");
    FilteredTable table;
    _filter(pk,table);
    lnq = _lnq;
    power = table.power;
}

double local::QuadratureCorrelatorEngine::getSigma4(std::vector<double> const &pk) const {
    checkPower(pk,"QuadratureCorrelatorEngine::getSigma4");
    FilteredTable table;
    _filter(pk,table);
    return _getSigma4(table);
}

void local::getGaussLegendreRule(int n, std::vector<double> &nodes, std::vector<double> &weights) {
    if(n < 1) {
        throw ValueError("getGaussLegendreRule: expected n >= 1.");
    }
    double pi(std::atan2(0,-1));
    nodes.resize(n);
    weights.resize(n);
    // Roots are symmetric so only find half of them, using Newton-Raphson
    // starting from an analytic guess.
    int nhalf = (n + 1)/2;
    for(int i = 0; i < nhalf; ++i) {
        double z = std::cos(pi*(i + 0.75)/(n + 0.5)), zlast, dpdz;
        do {
            double p1(1), p2(0);
            for(int j = 0; j < n; ++j) {
                double p3 = p2;
                p2 = p1;
                p1 = ((2*j + 1.)*z*p2 - j*p3)/(j + 1.);
            }
            // p1 is now P_n and p2 is P_{n-1}
            dpdz = n*(z*p1 - p2)/(z*z - 1);
            zlast = z;
            z = zlast - p1/dpdz;
        } while(std::fabs(z - zlast) > 1e-15);
        double w = 2/((1 - z*z)*dpdz*dpdz);
        nodes[i] = -z;
        weights[i] = w;
        nodes[n-i-1] = z;
        weights[n-i-1] = w;
    }
}

double local::getPropagatorKernel(double r) {
    double r2 = r*r;
    if(r < 1e-2) {
        return -168 + 928./5.*r2 - 4512./35.*r2*r2;
    }
    if(r > 1e2) {
        return -488./5. + 96./5./r2 - 16./21./(r2*r2);
    }
    double result = 12/r2 - 158 + 100*r2 - 42*r2*r2;
    if(std::fabs(r - 1) > 1e-10) {
        double d = r2 - 1;
        result += 3/(r2*r)*d*d*d*(7*r2 + 2)*std::log(std::fabs((1 + r)/(1 - r)));
    }
    return result;
}
