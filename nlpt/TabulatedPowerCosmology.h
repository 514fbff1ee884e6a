#ifndef NLPT_TABULATED_POWER_COSMOLOGY
#define NLPT_TABULATED_POWER_COSMOLOGY

#include "nlpt/AbsPowerCosmology.h"
#include "nlpt/Halofit.h"
#include "nlpt/types.h"

#include "likely/types.h"

#include "boost/smart_ptr.hpp"

namespace nlpt {
    // Represents a Lambda-CDM cosmology (with optional curvature) whose present-day
    // linear matter power spectrum is tabulated. The linear power at scale factor a
    // is D(a)^2 P0(k) and the nonlinear power is obtained with halofit.
	class TabulatedPowerCosmology : public AbsPowerCosmology {
	public:
	    // Creates a new cosmology from the present-day linear power P0(k) and the
	    // present-day density parameters. The growth factor is tabulated on nz
	    // redshifts covering [0,zmax] with the specified absolute accuracy.
		TabulatedPowerCosmology(TabulatedPowerCPtr power, double OmegaMatter,
		    double OmegaLambda, double zmax = 100, int nz = 2000, double epsAbs = 1e-10);
		virtual ~TabulatedPowerCosmology();
        virtual double getLinearPower(double k, double a) const;
        virtual double getNonlinearPower(double k, double a) const;
        virtual double getGrowthFactor(double a) const;
        // Returns 11 log-spaced values covering [0.01,0.1) followed by 40 linearly
        // spaced values covering [0.1,1].
        virtual std::vector<double> getDefaultScaleFactors() const;
        using AbsPowerCosmology::getLinearPower;
        using AbsPowerCosmology::getNonlinearPower;
		// Returns the present-day curvature defined as 1 - OmegaMatter - OmegaLambda.
        double getCurvature() const;
		// Returns the normalized Hubble function value H(z)/H(0) at the specified
		// redshift z >= 0.
        double getHubbleFunction(double z) const;
        // Returns the matter density parameter at scale factor a.
        double getOmegaMatter(double a) const;
	private:
        TabulatedPowerCPtr _power;
        double _OmegaMatter, _OmegaLambda, _curvature, _zmax, _epsAbs;
        int _nz;
        mutable double _growthNorm;
        mutable likely::InterpolatorPtr _growthInterpolator;
        Halofit _halofit;
        mutable double _halofitScaleFactor;
        mutable Halofit::Parameters _halofitParams;
        double _growthIntegrand(double z) const;
        double _unnormalizedGrowth(double z) const;
	}; // TabulatedPowerCosmology

	inline double TabulatedPowerCosmology::getCurvature() const { return _curvature; }
} // nlpt

#endif // NLPT_TABULATED_POWER_COSMOLOGY
