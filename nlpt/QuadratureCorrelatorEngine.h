#ifndef NLPT_QUADRATURE_CORRELATOR_ENGINE
#define NLPT_QUADRATURE_CORRELATOR_ENGINE

#include "nlpt/AbsCorrelatorEngine.h"
#include "nlpt/types.h"

#include "boost/smart_ptr.hpp"

#include <vector>

namespace nlpt {
    // Calculates one-loop correlators by direct quadrature over (ln q, mu, phi).
    // The input power is first extended as a power law to [10^lowExtrap,10^highExtrap],
    // zero padded with padFactor*nk samples at each end, optionally tapered over
    // the specified number of decades at each end, and finally smoothed by tapering
    // the highest windowSmoothing fraction of its Fourier modes. Requires FFTW3.
	class QuadratureCorrelatorEngine : public AbsCorrelatorEngine {
	public:
		QuadratureCorrelatorEngine(std::vector<double> const &k, int terms,
		    double padFactor = 1, double lowExtrap = -5, double highExtrap = 3,
		    WindowTaper const &windowTaper = WindowTaper(), double windowSmoothing = 0.75,
		    int nMu = 32, int nPhi = 8, bool verbose = false);
		virtual ~QuadratureCorrelatorEngine();
        virtual CorrelatorTerms getDensityBiasTerms(std::vector<double> const &pk) const;
        virtual CorrelatorTerms getTidalAlignmentTerms(std::vector<double> const &pk) const;
        virtual CorrelatorTerms getTidalTorquingTerms(std::vector<double> const &pk) const;
        virtual CorrelatorTerms getMixedAlignmentTerms(std::vector<double> const &pk) const;
        // Fills the vectors provided with the extended, padded and filtered table of
        // ln(q) and P(q) that the correlator integrals use.
        void getFilteredPower(std::vector<double> const &pk,
            std::vector<double> &lnq, std::vector<double> &power) const;
        // Returns the number of samples in the extended table.
        int getTableSize() const;
        // Returns sigma4 = Integral[d^3q/(2pi)^3 P(q)^2] of the filtered table.
        double getSigma4(std::vector<double> const &pk) const;
	private:
	    class FilteredTable;
        double _windowSmoothing;
        WindowTaper _windowTaper;
        int _nLow, _nHigh, _nPad, _nMu, _nPhi;
        double _dlnk;
        std::vector<double> _lnq;
        std::vector<double> _muNode, _muWeight, _cosPhi;
		class Implementation;
		boost::scoped_ptr<Implementation> _pimpl;
        void _filter(std::vector<double> const &pk, FilteredTable &table) const;
        void _integrateModeCoupling(FilteredTable const &table, CorrelatorTerms &result) const;
        void _integrateOneLoopPropagator(FilteredTable const &table, bool alignment,
            CorrelatorTerms &result) const;
        double _getSigma4(FilteredTable const &table) const;
	}; // QuadratureCorrelatorEngine

	inline int QuadratureCorrelatorEngine::getTableSize() const { return (int)_lnq.size(); }

	// Fills the vectors provided with the nodes and weights for n-point Gauss-Legendre
	// integration over [-1,+1].
	void getGaussLegendreRule(int n, std::vector<double> &nodes, std::vector<double> &weights);

	// Returns the P13 kernel bracket 12/r^2 - 158 + 100r^2 - 42r^4
	// + 3/r^3 (r^2-1)^3 (7r^2+2) ln|(1+r)/(1-r)|, using series expansions where
	// direct evaluation loses precision.
	double getPropagatorKernel(double r);
} // nlpt

#endif // NLPT_QUADRATURE_CORRELATOR_ENGINE
