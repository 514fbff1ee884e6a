#ifndef NLPT_PT_COMBINATIONS
#define NLPT_PT_COMBINATIONS

#include "nlpt/PowerGrid.h"
#include "nlpt/PtTracer.h"
#include "nlpt/types.h"

#include <iosfwd>
#include <vector>

namespace nlpt {

    // Combines cached correlators with tracer biases into power spectra on a
    // (numK, numZ) grid. In each function, growth4 holds D(z)^4 at each redshift
    // and Pd1d1 is the matter power spectrum (one-loop, nonlinear or linear) on the
    // same grid. Correlators are scaled to each redshift by growth4. Throws a
    // ShapeError if any input does not match the grid, or a ValueError if the
    // required correlators were not computed.

    // Returns the number counts x number counts power. When subtractLowK is set, the
    // k -> 0 limits of the b2 and bs terms are removed using sigma4.
    PowerGrid getGalaxyGalaxyPower(CorrelatorBundles const &bundles,
        NumberCountsBias const &bias1, NumberCountsBias const &bias2,
        std::vector<double> const &growth4, PowerGrid const &Pd1d1, bool subtractLowK);

    // Returns the number counts x matter power.
    PowerGrid getGalaxyMatterPower(CorrelatorBundles const &bundles,
        NumberCountsBias const &bias, std::vector<double> const &growth4,
        PowerGrid const &Pd1d1);

    // Returns the intrinsic alignment x matter power.
    PowerGrid getAlignmentMatterPower(CorrelatorBundles const &bundles,
        AlignmentBias const &bias, std::vector<double> const &growth4,
        PowerGrid const &Pd1d1);

    // Returns the number counts x intrinsic alignment power. Only the linear number
    // counts bias is included, and a warning is written on each call.
    PowerGrid getGalaxyAlignmentPower(CorrelatorBundles const &bundles,
        NumberCountsBias const &ncBias, AlignmentBias const &iaBias,
        std::vector<double> const &growth4, PowerGrid const &Pd1d1);

    // Returns the E-mode (or B-mode, if bmode is set) intrinsic alignment x intrinsic
    // alignment power.
    PowerGrid getAlignmentAlignmentPower(CorrelatorBundles const &bundles,
        AlignmentBias const &bias1, AlignmentBias const &bias2,
        std::vector<double> const &growth4, PowerGrid const &Pd1d1, bool bmode = false);

    // Returns a copy of Pd1d1.
    PowerGrid getMatterMatterPower(PowerGrid const &Pd1d1);

    // Sets the stream used for warnings, which is std::cerr by default.
    void setWarningStream(std::ostream &os);
    std::ostream &getWarningStream();

} // nlpt

#endif // NLPT_PT_COMBINATIONS
