#include "nlpt/AbsPowerCosmology.h"

namespace local = nlpt;

local::AbsPowerCosmology::AbsPowerCosmology() { }

local::AbsPowerCosmology::~AbsPowerCosmology() { }

std::vector<double> local::AbsPowerCosmology::getLinearPower(std::vector<double> const &k,
double a) const {
    std::vector<double> power;
    power.reserve(k.size());
    for(std::vector<double>::const_iterator iter = k.begin(); iter != k.end(); ++iter) {
        power.push_back(getLinearPower(*iter,a));
    }
    return power;
}

std::vector<double> local::AbsPowerCosmology::getNonlinearPower(std::vector<double> const &k,
double a) const {
    std::vector<double> power;
    power.reserve(k.size());
    for(std::vector<double>::const_iterator iter = k.begin(); iter != k.end(); ++iter) {
        power.push_back(getNonlinearPower(*iter,a));
    }
    return power;
}
