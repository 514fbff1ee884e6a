#include "nlpt/PtTracer.h"
#include "nlpt/RuntimeError.h"

#include "likely/Interpolator.h"

#include "boost/format.hpp"

namespace local = nlpt;

local::PtTracer::PtTracer(Type type, BiasFunction first, BiasFunction second, BiasFunction third)
: _type(type), _first(first), _second(second), _third(third)
{ }

local::PtTracer::~PtTracer() { }

double local::PtTracer::_evaluate(Type type, BiasFunction const &bias, char const *name,
double z) const {
    if(type != _type) {
        throw TypeError(boost::str(boost::format("PtTracer::%s: not defined for %s tracers.")
            % name % getTracerTypeName(_type)));
    }
    return bias(z);
}

double local::PtTracer::b1(double z) const { return _evaluate(NumberCounts,_first,"b1",z); }
double local::PtTracer::b2(double z) const { return _evaluate(NumberCounts,_second,"b2",z); }
double local::PtTracer::bs(double z) const { return _evaluate(NumberCounts,_third,"bs",z); }

double local::PtTracer::c1(double z) const { return _evaluate(IntrinsicAlignment,_first,"c1",z); }
double local::PtTracer::c2(double z) const { return _evaluate(IntrinsicAlignment,_second,"c2",z); }
double local::PtTracer::cdelta(double z) const {
    return _evaluate(IntrinsicAlignment,_third,"cdelta",z);
}

local::NumberCountsBias local::PtTracer::getNumberCountsBias(std::vector<double> const &z) const {
    NumberCountsBias bias;
    bias.b1.reserve(z.size());
    bias.b2.reserve(z.size());
    bias.bs.reserve(z.size());
    for(std::vector<double>::const_iterator iter = z.begin(); iter != z.end(); ++iter) {
        bias.b1.push_back(b1(*iter));
        bias.b2.push_back(b2(*iter));
        bias.bs.push_back(bs(*iter));
    }
    return bias;
}

local::AlignmentBias local::PtTracer::getAlignmentBias(std::vector<double> const &z) const {
    AlignmentBias bias;
    bias.c1.reserve(z.size());
    bias.c2.reserve(z.size());
    bias.cdelta.reserve(z.size());
    for(std::vector<double>::const_iterator iter = z.begin(); iter != z.end(); ++iter) {
        bias.c1.push_back(c1(*iter));
        bias.c2.push_back(c2(*iter));
        bias.cdelta.push_back(cdelta(*iter));
    }
    return bias;
}

std::string local::getTracerTypeName(PtTracer::Type type) {
    switch(type) {
        case PtTracer::NumberCounts:
        return "NC";
        case PtTracer::IntrinsicAlignment:
        return "IA";
        case PtTracer::Matter:
        return "M";
    }
    throw NotImplementedError("getTracerTypeName: unknown tracer type.");
}

local::PtTracerCPtr local::createNumberCountsTracer(BiasFunction b1, BiasFunction b2,
BiasFunction bs) {
    if(!b1 || !b2 || !bs) {
        throw ValueError("createNumberCountsTracer: missing bias function.");
    }
    PtTracerCPtr tracer(new PtTracer(PtTracer::NumberCounts,b1,b2,bs));
    return tracer;
}

local::PtTracerCPtr local::createIntrinsicAlignmentTracer(BiasFunction c1, BiasFunction c2,
BiasFunction cdelta) {
    if(!c1 || !c2 || !cdelta) {
        throw ValueError("createIntrinsicAlignmentTracer: missing bias function.");
    }
    PtTracerCPtr tracer(new PtTracer(PtTracer::IntrinsicAlignment,c1,c2,cdelta));
    return tracer;
}

local::PtTracerCPtr local::createMatterTracer() {
    PtTracerCPtr tracer(new PtTracer(PtTracer::Matter,BiasFunction(),BiasFunction(),BiasFunction()));
    return tracer;
}

namespace nlpt {
    class ConstantBias {
    public:
        explicit ConstantBias(double value) : _value(value) { }
        double operator()(double z) const { return _value; }
    private:
        double _value;
    };
    class TabulatedBias {
    public:
        TabulatedBias(std::vector<double> const &z, std::vector<double> const &bias)
        : _zmin(z.front()), _zmax(z.back()), _bmin(bias.front()), _bmax(bias.back()) {
            if(z.size() > 1) {
                _interpolator.reset(new likely::Interpolator(z,bias,
                    z.size() < 3 ? "linear" : "cspline"));
            }
        }
        double operator()(double z) const {
            if(z <= _zmin) return _bmin;
            if(z >= _zmax) return _bmax;
            return (*_interpolator)(z);
        }
    private:
        double _zmin, _zmax, _bmin, _bmax;
        likely::InterpolatorPtr _interpolator;
    };
} // nlpt

local::BiasFunction local::constantBias(double value) {
    return BiasFunction(ConstantBias(value));
}

local::BiasFunction local::tabulatedBias(std::vector<double> const &z,
std::vector<double> const &bias) {
    if(z.size() != bias.size()) {
        throw ShapeError("tabulatedBias: input vectors have different sizes.");
    }
    if(z.empty()) {
        throw ValueError("tabulatedBias: need at least one point.");
    }
    for(std::size_t i = 1; i < z.size(); ++i) {
        if(z[i] <= z[i-1]) {
            throw ValueError("tabulatedBias: redshifts must be increasing.");
        }
    }
    return BiasFunction(TabulatedBias(z,bias));
}
