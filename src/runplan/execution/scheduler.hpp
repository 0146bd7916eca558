/**
 * @file scheduler.hpp
 * @brief Eligibility and random selection of the next step.
 */
#pragma once
#include "runplan/common/common.hpp"
#include "runplan/common/plan.hpp"

namespace runplan
{

/**
 * @brief Picks an index in `[0, count)`. Called only with `count > 0`.
 */
using IndexPicker = std::function<size_t(size_t count)>;

/**
 * @brief Uniform picker over a Mersenne Twister seeded from `std::random_device`.
 */
IndexPicker make_uniform_picker();

/**
 * @brief Uniform picker over a Mersenne Twister with a fixed seed.
 */
IndexPicker make_uniform_picker(std::uint64_t seed);

/**
 * @brief Computes the eligible steps of a plan and chooses among them.
 *
 * @details
 * A step is eligible iff it is `Pending` and every one of its predecessors is
 * `Done`. A `Failed` predecessor blocks its dependents for the rest of the run.
 *
 * The choice among eligible steps is deliberately random, so that repeated
 * runs of a plan exercise different orders of independent steps and a missing
 * `after` edge eventually shows up as a failure.
 *
 * @par Thread Safety
 * - Not thread-safe; the picker carries mutable state.
 */
class Scheduler
{
public:
    /**
     * @brief Construct a scheduler.
     * @param picker Random source; an empty function selects `make_uniform_picker()`.
     */
    explicit Scheduler(IndexPicker picker = {});

    /**
     * @brief Indices of the eligible steps, in declaration order.
     * @note Predecessor ids that name no step never count as `Done`.
     */
    static std::vector<StepIdx> eligible(const Plan& plan);

    /**
     * @brief Choose the next step to run.
     * @return A uniformly chosen eligible step, or `std::nullopt` if none is.
     */
    std::optional<StepIdx> select_next(const Plan& plan);

private:
    IndexPicker m_picker;
};

} // namespace runplan
