#ifndef PHASE_CLASSIFIER_HPP
#define PHASE_CLASSIFIER_HPP

#include "CEED.hpp"

#include <vector>

namespace CEED {

/**
 * @brief Pure threshold classifier of total energy
 *
 * | Phase          | Range                 |
 * |----------------|-----------------------|
 * | STABLE         | E < T1                |
 * | STRESS         | T1 <= E < T2          |
 * | COUPLING       | T2 <= E < T3          |
 * | AMPLIFICATION  | T3 <= E < T4          |
 * | CASCADE        | E >= T4               |
 *
 * Thresholds must be finite and strictly increasing.
 */
class PhaseClassifier {
public:
    PhaseClassifier();
    explicit PhaseClassifier(const ThresholdArray& thresholds);
    explicit PhaseClassifier(const std::vector<double>& thresholds);

    Phase classify(double e_total) const;

    // Lower bound of a phase; 0 for STABLE
    double lowerBound(Phase p) const;

    const ThresholdArray& thresholds() const { return thresholds_; }

private:
    ThresholdArray thresholds_;

    void validate() const;
};

/**
 * @brief Classifier with a hysteresis band against flicker near boundaries
 *
 * Upward moves take effect immediately. A downward move happens only once
 * the energy has dropped at least h below the boundary, i.e. when
 * classify(E + h) is below the current phase. With h = 0 the tracker
 * reproduces the pure classifier.
 */
class PhaseTracker {
public:
    explicit PhaseTracker(const PhaseClassifier& classifier, double hysteresis = 0.0);

    Phase update(double e_total);
    void reset();

    Phase current() const { return current_; }
    bool initialized() const { return initialized_; }
    double hysteresis() const { return hysteresis_; }
    const PhaseClassifier& classifier() const { return classifier_; }

private:
    PhaseClassifier classifier_;
    double hysteresis_;
    Phase current_;
    bool initialized_;
};

} // namespace CEED

#endif // PHASE_CLASSIFIER_HPP
