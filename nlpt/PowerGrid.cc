#include "nlpt/PowerGrid.h"

namespace local = nlpt;

local::PowerGrid::PowerGrid() : _nk(0), _nz(0) { }

local::PowerGrid::PowerGrid(std::size_t nk, std::size_t nz, double value)
: _nk(nk), _nz(nz), _values(nk*nz,value)
{ }

local::PowerGrid::~PowerGrid() { }

std::vector<double> local::PowerGrid::getTransposedValues() const {
    std::vector<double> transposed(_values.size());
    for(std::size_t ik = 0; ik < _nk; ++ik) {
        for(std::size_t iz = 0; iz < _nz; ++iz) {
            transposed[iz*_nk + ik] = _values[ik*_nz + iz];
        }
    }
    return transposed;
}
