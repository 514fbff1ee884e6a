#include "nlpt/AbsCorrelatorEngine.h"
#include "nlpt/RuntimeError.h"

#include "boost/format.hpp"

namespace local = nlpt;

local::AbsCorrelatorEngine::AbsCorrelatorEngine(std::vector<double> const &k, int terms)
: _k(k), _terms(terms)
{
    if(k.size() < 2) {
        throw ValueError("AbsCorrelatorEngine: need at least 2 wavenumbers.");
    }
    if(k.front() <= 0) {
        throw ValueError("AbsCorrelatorEngine: wavenumbers must be positive.");
    }
    for(std::size_t i = 1; i < k.size(); ++i) {
        if(k[i] <= k[i-1]) {
            throw ValueError("AbsCorrelatorEngine: wavenumbers must be increasing.");
        }
    }
    if(terms <= 0 || terms > (OneLoopDensity | DensityBias | IntrinsicAlignment)) {
        throw ValueError("AbsCorrelatorEngine: invalid terms.");
    }
}

local::AbsCorrelatorEngine::~AbsCorrelatorEngine() { }

void local::AbsCorrelatorEngine::checkPower(std::vector<double> const &pk,
char const *method) const {
    if(pk.size() != _k.size()) {
        throw ShapeError(boost::str(boost::format(
            "%s: input power has %d samples but the grid has %d.")
            % method % pk.size() % _k.size()));
    }
}

void local::AbsCorrelatorEngine::checkTerms(int flags, char const *method) const {
    if(!hasTerms(flags)) {
        throw ValueError(boost::str(boost::format(
            "%s: engine was not configured for these terms.") % method));
    }
}
