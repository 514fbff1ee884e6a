#ifndef NLPT_POWER_GRID
#define NLPT_POWER_GRID

#include <vector>
#include <cstddef>

namespace nlpt {
    // Stores power values sampled on a (numK, numZ) grid, with redshift as the fast index.
	class PowerGrid {
	public:
		PowerGrid();
		PowerGrid(std::size_t nk, std::size_t nz, double value = 0);
		virtual ~PowerGrid();
		std::size_t getNK() const;
		std::size_t getNZ() const;
		double &operator()(std::size_t ik, std::size_t iz);
		double operator()(std::size_t ik, std::size_t iz) const;
		// Returns the values stored in row-major order, with index ik*nz + iz.
		std::vector<double> const &getValues() const;
		// Returns the values re-ordered with redshift as the slow index, iz*nk + ik.
		std::vector<double> getTransposedValues() const;
	private:
        std::size_t _nk, _nz;
        std::vector<double> _values;
	}; // PowerGrid

	inline std::size_t PowerGrid::getNK() const { return _nk; }
	inline std::size_t PowerGrid::getNZ() const { return _nz; }
	inline double &PowerGrid::operator()(std::size_t ik, std::size_t iz) {
	    return _values[ik*_nz + iz];
	}
	inline double PowerGrid::operator()(std::size_t ik, std::size_t iz) const {
	    return _values[ik*_nz + iz];
	}
	inline std::vector<double> const &PowerGrid::getValues() const { return _values; }
} // nlpt

#endif // NLPT_POWER_GRID
