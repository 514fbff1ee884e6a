#ifndef NLPT_CORRELATOR_BUNDLES
#define NLPT_CORRELATOR_BUNDLES

#include "nlpt/types.h"

#include <vector>
#include <cstddef>

namespace nlpt {

    // Indices of the density bias correlators.
    enum DensityBiasTerm {
        OneLoop = 0, FilteredLinear, Pd1d2, Pd2d2, Pd1s2, Pd2s2, Ps2s2, Sigma4,
        NumDensityBiasTerms
    };
    // Indices of the tidal alignment correlators.
    enum TidalAlignmentTerm { A00E = 0, C00E, A0E0E, A0B0B, NumTidalAlignmentTerms };
    // Indices of the tidal torquing correlators.
    enum TidalTorquingTerm { AE2E2 = 0, AB2B2, NumTidalTorquingTerms };
    // Indices of the mixed alignment correlators.
    enum MixedAlignmentTerm { A0E2 = 0, B0E2, D0EE2, D0BB2, NumMixedAlignmentTerms };

    // An immutable set of perturbation-theory correlators sampled on a common
    // wavenumber grid. Groups that were not computed are empty. All correlators
    // are evaluated at a = 1 and are scaled by the fourth power of the growth
    // factor to obtain values at other times.
	class CorrelatorBundles {
	public:
	    // Creates a new set of bundles for a grid of nk wavenumbers. Each group must either
	    // be empty or contain the expected number of arrays, each of size nk.
		CorrelatorBundles(std::size_t nk, CorrelatorTerms const &densityBias,
		    CorrelatorTerms const &tidalAlignment, CorrelatorTerms const &tidalTorquing,
		    CorrelatorTerms const &mixedAlignment);
		virtual ~CorrelatorBundles();
		std::size_t getNK() const;
		bool hasDensityBias() const;
		// True when all three intrinsic alignment groups are present.
		bool hasIntrinsicAlignment() const;
		// Returns the requested correlator array. Throws a ValueError if the
		// corresponding group was not computed.
		std::vector<double> const &getDensityBias(DensityBiasTerm term) const;
		std::vector<double> const &getTidalAlignment(TidalAlignmentTerm term) const;
		std::vector<double> const &getTidalTorquing(TidalTorquingTerm term) const;
		std::vector<double> const &getMixedAlignment(MixedAlignmentTerm term) const;
		// Returns a complete group, which will be empty if it was not computed.
		CorrelatorTerms const &getDensityBiasTerms() const;
		CorrelatorTerms const &getTidalAlignmentTerms() const;
		CorrelatorTerms const &getTidalTorquingTerms() const;
		CorrelatorTerms const &getMixedAlignmentTerms() const;
	private:
        std::size_t _nk;
        CorrelatorTerms _densityBias, _tidalAlignment, _tidalTorquing, _mixedAlignment;
	}; // CorrelatorBundles

	inline std::size_t CorrelatorBundles::getNK() const { return _nk; }
	inline bool CorrelatorBundles::hasDensityBias() const { return !_densityBias.empty(); }
	inline bool CorrelatorBundles::hasIntrinsicAlignment() const {
	    return !_tidalAlignment.empty() && !_tidalTorquing.empty() && !_mixedAlignment.empty();
	}
	inline CorrelatorTerms const &CorrelatorBundles::getDensityBiasTerms() const {
	    return _densityBias;
	}
	inline CorrelatorTerms const &CorrelatorBundles::getTidalAlignmentTerms() const {
	    return _tidalAlignment;
	}
	inline CorrelatorTerms const &CorrelatorBundles::getTidalTorquingTerms() const {
	    return _tidalTorquing;
	}
	inline CorrelatorTerms const &CorrelatorBundles::getMixedAlignmentTerms() const {
	    return _mixedAlignment;
	}
} // nlpt

#endif // NLPT_CORRELATOR_BUNDLES
