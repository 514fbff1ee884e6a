#ifndef NLPT_ABS_POWER_COSMOLOGY
#define NLPT_ABS_POWER_COSMOLOGY

#include <vector>

namespace nlpt {
    // Describes the matter power spectra and linear growth of a background cosmology.
    // Wavenumbers are in 1/Mpc and powers in Mpc^3.
	class AbsPowerCosmology {
	public:
		AbsPowerCosmology();
		virtual ~AbsPowerCosmology();
		// Returns the linear matter power spectrum at wavenumber k and scale factor a.
        virtual double getLinearPower(double k, double a) const = 0;
		// Returns the nonlinear matter power spectrum at wavenumber k and scale factor a.
        virtual double getNonlinearPower(double k, double a) const = 0;
        // Returns the linear growth factor D(a), normalized so that D(1) = 1.
        virtual double getGrowthFactor(double a) const = 0;
        // Returns the scale factors that this cosmology uses internally to sample
        // power spectra, in increasing order.
        virtual std::vector<double> getDefaultScaleFactors() const = 0;
        // Evaluates the linear (or nonlinear) power at each of the specified wavenumbers.
        std::vector<double> getLinearPower(std::vector<double> const &k, double a) const;
        std::vector<double> getNonlinearPower(std::vector<double> const &k, double a) const;
	private:
	}; // AbsPowerCosmology
} // nlpt

#endif // NLPT_ABS_POWER_COSMOLOGY
