#ifndef NLPT_HALOFIT
#define NLPT_HALOFIT

#include "boost/function.hpp"

#include <vector>

namespace nlpt {
	class Halofit {
	// Estimates the nonlinear matter power spectrum from the linear one using the
	// halofit fitting formulae with the coefficients of the Bird, Viel & Haehnelt (2012)
	// calibration, without massive neutrinos.
	public:
		typedef boost::function<double (double)> LinearPower;
		// Describes the nonlinear scale of one epoch. When linear is true, the
		// nonlinear scale lies above the largest k considered and the linear power is
		// used without correction.
		struct Parameters {
			double ksigma, neff, curvature;
			bool linear;
		};
		// Creates a new calculator that integrates the linear power over nk
		// logarithmically spaced wavenumbers covering [kmin,kmax] in 1/Mpc.
		Halofit(double kmin = 1e-5, double kmax = 1e3, int nk = 2000);
		virtual ~Halofit();
		// Finds the nonlinear scale, effective index and curvature of the specified
		// linear power spectrum.
		Parameters getParameters(LinearPower const &linearPower) const;
		// Returns the nonlinear power at k given the linear power at k, the matter
		// density Omega_m(a) of the same epoch and its parameters.
		double getPower(double k, double linearPower, double OmegaMatter,
			Parameters const &params) const;
	private:
		double _dlnk;
		std::vector<double> _k;
	}; // Halofit
} // nlpt

#endif // NLPT_HALOFIT
