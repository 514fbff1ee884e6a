// Tabulates the perturbation-theory power spectrum of two tracers, e.g.
// ptpower --load-power pk0.dat --tracer1 nc --b1 2 --b2 0.5 --tracer2 m --save pgm.dat

#include "nlpt/nlpt.h"

#include "boost/program_options.hpp"
#include "boost/format.hpp"

#include <fstream>
#include <iostream>
#include <cmath>
#include <string>
#include <utility>
#include <vector>

namespace po = boost::program_options;

// Parses a tracer name into a tracer type, returning false if the name is not recognized.
bool parseTracerType(std::string const &name, nlpt::PtTracer::Type &type) {
    if(name == "nc") type = nlpt::PtTracer::NumberCounts;
    else if(name == "ia") type = nlpt::PtTracer::IntrinsicAlignment;
    else if(name == "m") type = nlpt::PtTracer::Matter;
    else return false;
    return true;
}

nlpt::PtTracerCPtr createTracer(nlpt::PtTracer::Type type, double first, double second,
double third) {
    switch(type) {
        case nlpt::PtTracer::NumberCounts:
        return nlpt::createNumberCountsTracer(nlpt::constantBias(first),
            nlpt::constantBias(second),nlpt::constantBias(third));
        case nlpt::PtTracer::IntrinsicAlignment:
        return nlpt::createIntrinsicAlignmentTracer(nlpt::constantBias(first),
            nlpt::constantBias(second),nlpt::constantBias(third));
        case nlpt::PtTracer::Matter:
        return nlpt::createMatterTracer();
    }
    throw nlpt::NotImplementedError("createTracer: unknown tracer type.");
}

int main(int argc, char **argv) {

    // Configure command-line option processing
    po::options_description cli("Perturbation theory power spectrum calculator");
    double OmegaMatter,OmegaLambda,b1,b2,bs,c1,c2,cdelta,b1b,b2b,bsb,c1b,c2b,cdeltab,
        log10kMin,log10kMax,nkPerDecade,padFactor,lowExtrap,highExtrap,windowSmoothing,
        taperLow,taperHigh,amin,amax;
    int na,nMu,nPhi,extrapLoK,extrapHiK;
    std::string loadPowerFile,saveFile,tracer1Name,tracer2Name;
    cli.add_options()
        ("help,h", "Prints this info and exits.")
        ("verbose", "Prints additional information.")
        ("load-power", po::value<std::string>(&loadPowerFile)->default_value(""),
            "Reads present-day linear k,P(k) values (in 1/Mpc, Mpc^3) from the specified filename.")
        ("omega-matter", po::value<double>(&OmegaMatter)->default_value(0.3),
            "Present-day value of OmegaMatter.")
        ("omega-lambda", po::value<double>(&OmegaLambda)->default_value(0),
            "Present-day value of OmegaLambda or zero for 1-OmegaMatter.")
        ("tracer1", po::value<std::string>(&tracer1Name)->default_value("m"),
            "Type of the first tracer (nc, ia or m).")
        ("tracer2", po::value<std::string>(&tracer2Name)->default_value(""),
            "Type of the second tracer (nc, ia or m), or empty for an auto-correlation.")
        ("b1", po::value<double>(&b1)->default_value(1), "Linear bias of a nc tracer1.")
        ("b2", po::value<double>(&b2)->default_value(0), "Quadratic bias of a nc tracer1.")
        ("bs", po::value<double>(&bs)->default_value(0), "Tidal bias of a nc tracer1.")
        ("c1", po::value<double>(&c1)->default_value(1), "Tidal alignment of an ia tracer1.")
        ("c2", po::value<double>(&c2)->default_value(0), "Tidal torquing of an ia tracer1.")
        ("cdelta", po::value<double>(&cdelta)->default_value(0),
            "Density-weighted alignment of an ia tracer1.")
        ("b1b", po::value<double>(&b1b)->default_value(1), "Linear bias of a nc tracer2.")
        ("b2b", po::value<double>(&b2b)->default_value(0), "Quadratic bias of a nc tracer2.")
        ("bsb", po::value<double>(&bsb)->default_value(0), "Tidal bias of a nc tracer2.")
        ("c1b", po::value<double>(&c1b)->default_value(1), "Tidal alignment of an ia tracer2.")
        ("c2b", po::value<double>(&c2b)->default_value(0), "Tidal torquing of an ia tracer2.")
        ("cdeltab", po::value<double>(&cdeltab)->default_value(0),
            "Density-weighted alignment of an ia tracer2.")
        ("log10k-min", po::value<double>(&log10kMin)->default_value(-4),
            "Log10 of the smallest wavenumber in 1/Mpc.")
        ("log10k-max", po::value<double>(&log10kMax)->default_value(2),
            "Log10 of the largest wavenumber in 1/Mpc.")
        ("nk-per-decade", po::value<double>(&nkPerDecade)->default_value(20),
            "Number of wavenumber samples per decade.")
        ("pad-factor", po::value<double>(&padFactor)->default_value(1),
            "Zero padding added at each end, as a fraction of the number of wavenumbers.")
        ("low-extrap", po::value<double>(&lowExtrap)->default_value(-5),
            "Log10 of the wavenumber that the linear power is extrapolated down to.")
        ("high-extrap", po::value<double>(&highExtrap)->default_value(3),
            "Log10 of the wavenumber that the linear power is extrapolated up to.")
        ("taper-low", po::value<double>(&taperLow)->default_value(0),
            "Decades of k tapered at the low end of the extended power.")
        ("taper-high", po::value<double>(&taperHigh)->default_value(0),
            "Decades of k tapered at the high end of the extended power.")
        ("window-smoothing", po::value<double>(&windowSmoothing)->default_value(0.75),
            "Fraction of Fourier modes of the extended power that are tapered.")
        ("nmu", po::value<int>(&nMu)->default_value(32),
            "Number of Gauss-Legendre points for integrating over mu.")
        ("nphi", po::value<int>(&nPhi)->default_value(8),
            "Number of points for averaging over the azimuthal angle.")
        ("no-nc", "Does not calculate number counts correlators.")
        ("no-ia", "Does not calculate intrinsic alignment correlators.")
        ("sub-lowk", "Subtracts the k -> 0 limit of the quadratic and tidal bias terms.")
        ("linear", "Uses the linear (instead of nonlinear) matter power.")
        ("bb", "Calculates the B-mode intrinsic alignment power.")
        ("amin", po::value<double>(&amin)->default_value(0),
            "Smallest scale factor to tabulate, or zero for the default samples.")
        ("amax", po::value<double>(&amax)->default_value(1),
            "Largest scale factor to tabulate.")
        ("na", po::value<int>(&na)->default_value(10),
            "Number of linearly spaced scale factors to tabulate.")
        ("extrap-lowk", po::value<int>(&extrapLoK)->default_value(1),
            "Order of ln(k) extrapolation below the grid (0, 1 or 2).")
        ("extrap-highk", po::value<int>(&extrapHiK)->default_value(2),
            "Order of ln(k) extrapolation above the grid (0, 1 or 2).")
        ("save", po::value<std::string>(&saveFile)->default_value(""),
            "Saves k,a,P(k,a) values to the specified filename.")
        ;

    // do the command line parsing now
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, cli), vm);
        po::notify(vm);
    }
    catch(std::exception const &e) {
        std::cerr << "Unable to parse command line options: " << e.what() << std::endl;
        return -1;
    }
    if(vm.count("help")) {
        std::cout << cli << std::endl;
        return 1;
    }
    bool verbose(vm.count("verbose")), noNC(vm.count("no-nc")), noIA(vm.count("no-ia")),
        subLowK(vm.count("sub-lowk")), linear(vm.count("linear")), bmode(vm.count("bb"));

    if(0 == loadPowerFile.length()) {
        std::cerr << "Missing required load-power option." << std::endl;
        return -1;
    }
    nlpt::PtTracer::Type type1, type2;
    if(!parseTracerType(tracer1Name,type1)) {
        std::cerr << "Invalid tracer1 type: " << tracer1Name << std::endl;
        return -1;
    }
    if(0 == tracer2Name.length()) tracer2Name = tracer1Name;
    if(!parseTracerType(tracer2Name,type2)) {
        std::cerr << "Invalid tracer2 type: " << tracer2Name << std::endl;
        return -1;
    }

    try {
        // Build the cosmology.
        if(OmegaLambda == 0) OmegaLambda = 1 - OmegaMatter;
        nlpt::TabulatedPowerCPtr power = nlpt::createTabulatedPower(loadPowerFile,true,true,
            1e-2,verbose);
        nlpt::TabulatedPowerCosmology cosmology(power,OmegaMatter,OmegaLambda);
        if(verbose) {
            std::cout << "curvature = " << cosmology.getCurvature() << std::endl;
            std::cout << "D(a=0.5) = " << cosmology.getGrowthFactor(0.5) << std::endl;
        }

        // Build the calculator.
        nlpt::CalculatorConfig config;
        config.withNumberCounts = !noNC;
        config.withIntrinsicAlignment = !noIA;
        config.log10kMin = log10kMin;
        config.log10kMax = log10kMax;
        config.nkPerDecade = nkPerDecade;
        config.padFactor = padFactor;
        config.lowExtrap = lowExtrap;
        config.highExtrap = highExtrap;
        if(taperLow > 0 || taperHigh > 0) {
            config.windowTaper = std::make_pair(taperLow,taperHigh);
        }
        config.windowSmoothing = windowSmoothing;
        config.nMu = nMu;
        config.nPhi = nPhi;
        config.verbose = verbose;

        nlpt::PtPowerOptions options;
        options.calculator.reset(new nlpt::PtCalculator(config));
        options.tracer2 = createTracer(type2,
            type2 == nlpt::PtTracer::NumberCounts ? b1b : c1b,
            type2 == nlpt::PtTracer::NumberCounts ? b2b : c2b,
            type2 == nlpt::PtTracer::NumberCounts ? bsb : cdeltab);
        options.subtractLowK = subLowK;
        options.useNonlinear = !linear;
        options.returnIaBB = bmode;
        options.extrapOrderLoK = extrapLoK;
        options.extrapOrderHiK = extrapHiK;
        if(amin > 0) {
            if(na < 1 || amin > amax || (na == 1 && amin != amax)) {
                std::cerr << "Invalid scale factor range." << std::endl;
                return -1;
            }
            for(int i = 0; i < na; ++i) {
                options.scaleFactors.push_back(na == 1 ? amin : amin + (amax-amin)*i/(na-1.));
            }
        }
        nlpt::PtTracerCPtr tracer1 = createTracer(type1,
            type1 == nlpt::PtTracer::NumberCounts ? b1 : c1,
            type1 == nlpt::PtTracer::NumberCounts ? b2 : c2,
            type1 == nlpt::PtTracer::NumberCounts ? bs : cdelta);

        nlpt::PowerSpectrum2DCPtr result = nlpt::getPtPower2D(cosmology,tracer1,options);
        if(verbose) {
            std::cout << "Tabulated " << nlpt::getTracerTypeName(type1) << " x "
                << nlpt::getTracerTypeName(type2) << " power at " << result->getNA()
                << " scale factors and " << result->getNK() << " wavenumbers." << std::endl;
        }

        if(saveFile.length() > 0) {
            std::ofstream out(saveFile.c_str());
            std::vector<double> const &a = result->getScaleFactors();
            std::vector<double> const &lnk = result->getLogWavenumbers();
            for(std::size_t ia = 0; ia < a.size(); ++ia) {
                for(std::size_t ik = 0; ik < lnk.size(); ++ik) {
                    out << boost::format("%.6e %.6f %.8e") % std::exp(lnk[ik]) % a[ia]
                        % result->getValue(ia,ik) << std::endl;
                }
            }
            out.close();
        }
    }
    catch(std::exception const &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
