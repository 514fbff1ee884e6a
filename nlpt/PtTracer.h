#ifndef NLPT_PT_TRACER
#define NLPT_PT_TRACER

#include "nlpt/types.h"

#include <string>
#include <vector>

namespace nlpt {

    // Bias coefficients of a number counts tracer sampled at a set of redshifts.
    struct NumberCountsBias {
        std::vector<double> b1, b2, bs;
    };

    // Bias coefficients of an intrinsic alignment tracer sampled at a set of redshifts.
    struct AlignmentBias {
        std::vector<double> c1, c2, cdelta;
    };

    // Represents a tracer of the matter density whose perturbation-theory power spectra
    // can be calculated. Number counts tracers carry the linear, quadratic and tidal
    // biases b1(z), b2(z), bs(z). Intrinsic alignment tracers carry the tidal
    // alignment, tidal torquing and density-weighting amplitudes c1(z), c2(z),
    // cdelta(z). Matter tracers carry no bias.
	class PtTracer {
	public:
	    enum Type { NumberCounts, IntrinsicAlignment, Matter };
		virtual ~PtTracer();
		Type getType() const;
		// Number counts biases. Throws a TypeError for other tracer types.
		double b1(double z) const;
		double b2(double z) const;
		double bs(double z) const;
		// Intrinsic alignment amplitudes. Throws a TypeError for other tracer types.
		double c1(double z) const;
		double c2(double z) const;
		double cdelta(double z) const;
		// Evaluates all three biases at each of the specified redshifts.
		NumberCountsBias getNumberCountsBias(std::vector<double> const &z) const;
		AlignmentBias getAlignmentBias(std::vector<double> const &z) const;
	private:
		friend PtTracerCPtr createNumberCountsTracer(BiasFunction, BiasFunction, BiasFunction);
		friend PtTracerCPtr createIntrinsicAlignmentTracer(BiasFunction, BiasFunction, BiasFunction);
		friend PtTracerCPtr createMatterTracer();
		PtTracer(Type type, BiasFunction first, BiasFunction second, BiasFunction third);
		Type _type;
		BiasFunction _first, _second, _third;
		double _evaluate(Type type, BiasFunction const &bias, char const *name, double z) const;
	}; // PtTracer

	inline PtTracer::Type PtTracer::getType() const { return _type; }

	// Returns a short name ("NC", "IA" or "M") for the specified tracer type.
	std::string getTracerTypeName(PtTracer::Type type);

	// Creates a new number counts tracer with the specified biases.
	PtTracerCPtr createNumberCountsTracer(BiasFunction b1, BiasFunction b2, BiasFunction bs);
	// Creates a new intrinsic alignment tracer with the specified amplitudes.
	PtTracerCPtr createIntrinsicAlignmentTracer(BiasFunction c1, BiasFunction c2, BiasFunction cdelta);
	// Creates a new matter tracer.
	PtTracerCPtr createMatterTracer();

	// Returns a bias function with the same value at all redshifts.
	BiasFunction constantBias(double value);
	// Returns a bias function interpolated from values tabulated at increasing redshifts.
	// Uses a cubic spline for three or more points and linear interpolation otherwise,
	// and holds the end values constant outside the tabulated range.
	BiasFunction tabulatedBias(std::vector<double> const &z, std::vector<double> const &bias);

} // nlpt

#endif // NLPT_PT_TRACER
