#include "nlpt/types.h"

#include "nlpt/RuntimeError.h"

#include "nlpt/AbsPowerCosmology.h"
#include "nlpt/TabulatedPower.h"
#include "nlpt/Halofit.h"
#include "nlpt/TabulatedPowerCosmology.h"

#include "nlpt/PtTracer.h"
#include "nlpt/PowerGrid.h"
#include "nlpt/CorrelatorBundles.h"
#include "nlpt/AbsCorrelatorEngine.h"
#include "nlpt/QuadratureCorrelatorEngine.h"
#include "nlpt/PtCalculator.h"
#include "nlpt/PtCombinations.h"
#include "nlpt/PowerSpectrum2D.h"
#include "nlpt/PtPower.h"
