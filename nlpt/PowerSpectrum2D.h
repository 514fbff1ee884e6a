#ifndef NLPT_POWER_SPECTRUM_2D
#define NLPT_POWER_SPECTRUM_2D

#include "likely/types.h"

#include <vector>
#include <cstddef>

namespace nlpt {
    // Represents a power spectrum P(k,a) tabulated on a grid of scale factors and
    // log-spaced wavenumbers. Each scale factor row is interpolated with a cubic spline
    // in ln(k) and rows are interpolated linearly in a. Outside the tabulated k range,
    // a Taylor expansion in ln(k) of order 0, 1 or 2 about the nearest end is used.
	class PowerSpectrum2D {
	public:
	    // Creates a new tabulated spectrum. The grid is stored with the scale factor as
	    // the slow index, grid[ia*nk + ik]. Scale factors can be provided in any order
	    // but must be distinct. When isLogPower is set the grid values are ln(P).
		PowerSpectrum2D(std::vector<double> const &a, std::vector<double> const &lnk,
		    std::vector<double> const &grid, bool isLogPower = false,
		    int extrapOrderLoK = 1, int extrapOrderHiK = 2);
		virtual ~PowerSpectrum2D();
		// Returns the power at wavenumber k and scale factor a. Throws a ValueError
		// for a outside the tabulated range.
		double operator()(double k, double a) const;
		double getPower(double k, double a) const;
		// Returns the scale factors in increasing order.
		std::vector<double> const &getScaleFactors() const;
		std::vector<double> const &getLogWavenumbers() const;
		std::size_t getNA() const;
		std::size_t getNK() const;
		// Returns the stored grid value (ln(P) if isLogPower) for the ia-th sorted scale factor.
		double getValue(std::size_t ia, std::size_t ik) const;
		bool isLogPower() const;
		int getExtrapOrderLoK() const;
		int getExtrapOrderHiK() const;
	private:
        std::vector<double> _a, _lnk;
        std::vector<std::vector<double> > _rows;
        std::vector<likely::InterpolatorPtr> _interpolators;
        std::vector<double> _lowSlope, _lowCurvature, _highSlope, _highCurvature;
        bool _isLogPower;
        int _extrapOrderLoK, _extrapOrderHiK;
        double _evaluateRow(std::size_t ia, double lnk) const;
	}; // PowerSpectrum2D

	inline double PowerSpectrum2D::operator()(double k, double a) const { return getPower(k,a); }
	inline std::vector<double> const &PowerSpectrum2D::getScaleFactors() const { return _a; }
	inline std::vector<double> const &PowerSpectrum2D::getLogWavenumbers() const { return _lnk; }
	inline std::size_t PowerSpectrum2D::getNA() const { return _a.size(); }
	inline std::size_t PowerSpectrum2D::getNK() const { return _lnk.size(); }
	inline double PowerSpectrum2D::getValue(std::size_t ia, std::size_t ik) const {
	    return _rows[ia][ik];
	}
	inline bool PowerSpectrum2D::isLogPower() const { return _isLogPower; }
	inline int PowerSpectrum2D::getExtrapOrderLoK() const { return _extrapOrderLoK; }
	inline int PowerSpectrum2D::getExtrapOrderHiK() const { return _extrapOrderHiK; }
} // nlpt

#endif // NLPT_POWER_SPECTRUM_2D
