// Checks tracer construction, bias evaluation and bias function interpolation.

#include "nlpt/nlpt.h"

#include <iostream>
#include <cmath>
#include <string>
#include <vector>

int failures(0);

void check(bool ok, std::string const &what) {
    if(!ok) {
        ++failures;
        std::cerr << "FAILED: " << what << std::endl;
    }
}

void checkClose(double value, double expected, double tol, std::string const &what) {
    bool ok = std::fabs(value - expected) <= tol;
    if(!ok) std::cerr << what << " = " << value << " (error = " << value-expected << ")" << std::endl;
    check(ok,what);
}

int main(int argc, char **argv) {

    // Number counts tracer with constant biases.
    nlpt::PtTracerCPtr nc = nlpt::createNumberCountsTracer(nlpt::constantBias(2),
        nlpt::constantBias(0.5),nlpt::constantBias(-0.25));
    check(nc->getType() == nlpt::PtTracer::NumberCounts,"nc type");
    checkClose(nc->b1(0.7),2,0,"nc b1");
    checkClose(nc->b2(3),0.5,0,"nc b2");
    checkClose(nc->bs(0),-0.25,0,"nc bs");
    try {
        nc->c1(0);
        check(false,"nc c1 should throw");
    }
    catch(nlpt::TypeError const &e) { }

    // Intrinsic alignment tracer.
    nlpt::PtTracerCPtr ia = nlpt::createIntrinsicAlignmentTracer(nlpt::constantBias(1),
        nlpt::constantBias(-1),nlpt::constantBias(0.3));
    check(ia->getType() == nlpt::PtTracer::IntrinsicAlignment,"ia type");
    checkClose(ia->c1(1),1,0,"ia c1");
    checkClose(ia->c2(1),-1,0,"ia c2");
    checkClose(ia->cdelta(1),0.3,0,"ia cdelta");
    try {
        ia->b1(0);
        check(false,"ia b1 should throw");
    }
    catch(nlpt::TypeError const &e) { }

    // Matter tracer has no biases.
    nlpt::PtTracerCPtr m = nlpt::createMatterTracer();
    check(m->getType() == nlpt::PtTracer::Matter,"matter type");
    try {
        m->bs(0);
        check(false,"matter bs should throw");
    }
    catch(nlpt::TypeError const &e) { }
    check(nlpt::getTracerTypeName(nlpt::PtTracer::IntrinsicAlignment) == "IA","type name");

    // Missing bias functions are rejected.
    try {
        nlpt::createNumberCountsTracer(nlpt::constantBias(1),nlpt::BiasFunction(),
            nlpt::constantBias(0));
        check(false,"missing bias should throw");
    }
    catch(nlpt::ValueError const &e) { }

    // Tabulated biases use a spline inside the table and hold the end values outside.
    std::vector<double> z, b;
    z.push_back(0); b.push_back(1);
    z.push_back(1); b.push_back(2);
    z.push_back(2); b.push_back(5);
    nlpt::BiasFunction spline = nlpt::tabulatedBias(z,b);
    for(std::size_t i = 0; i < z.size(); ++i) {
        checkClose(spline(z[i]),b[i],1e-12,"spline node");
    }
    checkClose(spline(-1),1,0,"spline below");
    checkClose(spline(10),5,0,"spline above");
    double mid = spline(1.5);
    check(mid > 2 && mid < 5,"spline between nodes");

    // Two points are interpolated linearly.
    z.pop_back();
    b.pop_back();
    nlpt::BiasFunction line = nlpt::tabulatedBias(z,b);
    checkClose(line(0.25),1.25,1e-12,"linear bias");

    // A single point is a constant.
    z.pop_back();
    b.pop_back();
    nlpt::BiasFunction single = nlpt::tabulatedBias(z,b);
    checkClose(single(3),1,0,"single point bias");

    std::vector<double> zbad(2,1.), bbad(2,1.);
    try {
        nlpt::tabulatedBias(zbad,bbad);
        check(false,"non-increasing z should throw");
    }
    catch(nlpt::ValueError const &e) { }
    bbad.push_back(1);
    try {
        nlpt::tabulatedBias(zbad,bbad);
        check(false,"size mismatch should throw");
    }
    catch(nlpt::ShapeError const &e) { }

    // Evaluation over a set of redshifts.
    nlpt::PtTracerCPtr evolving = nlpt::createNumberCountsTracer(line,nlpt::constantBias(0),
        nlpt::constantBias(0));
    std::vector<double> zeval;
    zeval.push_back(0);
    zeval.push_back(0.5);
    zeval.push_back(2);
    nlpt::NumberCountsBias bias = evolving->getNumberCountsBias(zeval);
    check(bias.b1.size() == 3 && bias.b2.size() == 3 && bias.bs.size() == 3,"bias sizes");
    checkClose(bias.b1[1],1.5,1e-12,"evolving b1");
    checkClose(bias.b1[2],2,1e-12,"evolving b1 clamped");
    nlpt::AlignmentBias alignment = ia->getAlignmentBias(zeval);
    check(alignment.cdelta.size() == 3,"alignment sizes");
    try {
        ia->getNumberCountsBias(zeval);
        check(false,"ia number counts bias should throw");
    }
    catch(nlpt::TypeError const &e) { }

    if(failures) std::cerr << failures << " test(s) failed." << std::endl;
    return failures ? 1 : 0;
}
