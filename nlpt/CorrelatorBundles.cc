#include "nlpt/CorrelatorBundles.h"
#include "nlpt/RuntimeError.h"

#include "boost/format.hpp"

namespace local = nlpt;

namespace nlpt {
    void checkGroup(CorrelatorTerms const &group, std::size_t expected, std::size_t nk,
    char const *name) {
        if(group.empty()) return;
        if(group.size() != expected) {
            throw ShapeError(boost::str(boost::format(
                "CorrelatorBundles: expected %d %s terms but got %d.")
                % expected % name % group.size()));
        }
        for(std::size_t i = 0; i < group.size(); ++i) {
            if(group[i].size() != nk) {
                throw ShapeError(boost::str(boost::format(
                    "CorrelatorBundles: %s term %d has size %d (expected %d).")
                    % name % i % group[i].size() % nk));
            }
        }
    }
    std::vector<double> const &getTerm(CorrelatorTerms const &group, int index, int size,
    char const *name) {
        if(group.empty()) {
            throw ValueError(boost::str(boost::format(
                "CorrelatorBundles: %s terms were not computed.") % name));
        }
        if(index < 0 || index >= size) {
            throw ValueError(boost::str(boost::format(
                "CorrelatorBundles: invalid %s term index %d.") % name % index));
        }
        return group[index];
    }
} // nlpt

local::CorrelatorBundles::CorrelatorBundles(std::size_t nk, CorrelatorTerms const &densityBias,
CorrelatorTerms const &tidalAlignment, CorrelatorTerms const &tidalTorquing,
CorrelatorTerms const &mixedAlignment)
: _nk(nk), _densityBias(densityBias), _tidalAlignment(tidalAlignment),
_tidalTorquing(tidalTorquing), _mixedAlignment(mixedAlignment)
{
    checkGroup(_densityBias,NumDensityBiasTerms,nk,"density bias");
    checkGroup(_tidalAlignment,NumTidalAlignmentTerms,nk,"tidal alignment");
    checkGroup(_tidalTorquing,NumTidalTorquingTerms,nk,"tidal torquing");
    checkGroup(_mixedAlignment,NumMixedAlignmentTerms,nk,"mixed alignment");
}

local::CorrelatorBundles::~CorrelatorBundles() { }

std::vector<double> const &local::CorrelatorBundles::getDensityBias(DensityBiasTerm term) const {
    return getTerm(_densityBias,term,NumDensityBiasTerms,"density bias");
}

std::vector<double> const &
local::CorrelatorBundles::getTidalAlignment(TidalAlignmentTerm term) const {
    return getTerm(_tidalAlignment,term,NumTidalAlignmentTerms,"tidal alignment");
}

std::vector<double> const &
local::CorrelatorBundles::getTidalTorquing(TidalTorquingTerm term) const {
    return getTerm(_tidalTorquing,term,NumTidalTorquingTerms,"tidal torquing");
}

std::vector<double> const &
local::CorrelatorBundles::getMixedAlignment(MixedAlignmentTerm term) const {
    return getTerm(_mixedAlignment,term,NumMixedAlignmentTerms,"mixed alignment");
}
