#include "PhaseClassifier.hpp"

#include <cmath>
#include <sstream>

namespace CEED {

PhaseClassifier::PhaseClassifier()
    : thresholds_{{120.0, 150.0, 200.0, 300.0}} {}

PhaseClassifier::PhaseClassifier(const ThresholdArray& thresholds)
    : thresholds_(thresholds) {
    validate();
}

PhaseClassifier::PhaseClassifier(const std::vector<double>& thresholds) {
    if (thresholds.size() != NUM_THRESHOLDS) {
        throw ConfigurationError("Exactly " + std::to_string(NUM_THRESHOLDS) +
                                 " phase thresholds are required, got " +
                                 std::to_string(thresholds.size()));
    }
    for (size_t i = 0; i < NUM_THRESHOLDS; ++i) {
        thresholds_[i] = thresholds[i];
    }
    validate();
}

void PhaseClassifier::validate() const {
    for (size_t i = 0; i < NUM_THRESHOLDS; ++i) {
        if (!std::isfinite(thresholds_[i])) {
            throw ConfigurationError("Phase thresholds must be finite");
        }
        if (i > 0 && !(thresholds_[i] > thresholds_[i - 1])) {
            std::ostringstream oss;
            oss << "Phase thresholds must be strictly increasing (T" << i
                << " = " << thresholds_[i - 1] << ", T" << i + 1
                << " = " << thresholds_[i] << ")";
            throw ConfigurationError(oss.str());
        }
    }
}

Phase PhaseClassifier::classify(double e_total) const {
    int level = 0;
    for (size_t i = 0; i < NUM_THRESHOLDS; ++i) {
        if (e_total >= thresholds_[i]) level = static_cast<int>(i) + 1;
    }
    return static_cast<Phase>(level);
}

double PhaseClassifier::lowerBound(Phase p) const {
    const size_t k = index(p);
    return k == 0 ? 0.0 : thresholds_[k - 1];
}

// =============================================================================
// PhaseTracker
// =============================================================================

PhaseTracker::PhaseTracker(const PhaseClassifier& classifier, double hysteresis)
    : classifier_(classifier), hysteresis_(hysteresis),
      current_(Phase::STABLE), initialized_(false) {
    if (!std::isfinite(hysteresis) || hysteresis < 0.0) {
        throw ConfigurationError("Phase hysteresis must be finite and non-negative");
    }
}

Phase PhaseTracker::update(double e_total) {
    const Phase raw = classifier_.classify(e_total);
    if (!initialized_) {
        current_ = raw;
        initialized_ = true;
        return current_;
    }

    if (index(raw) > index(current_)) {
        current_ = raw;
    } else if (index(raw) < index(current_)) {
        const Phase lagged = classifier_.classify(e_total + hysteresis_);
        if (index(lagged) < index(current_)) {
            current_ = lagged;
        }
    }
    return current_;
}

void PhaseTracker::reset() {
    current_ = Phase::STABLE;
    initialized_ = false;
}

} // namespace CEED
