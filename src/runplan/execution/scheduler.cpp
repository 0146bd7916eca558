/**
 * @file scheduler.cpp
 */
#include "runplan/execution/scheduler.hpp"

#include <random>

#include <spdlog/spdlog.h>

namespace runplan
{

namespace
{

IndexPicker picker_from_engine(std::shared_ptr<std::mt19937_64> engine)
{
    return [engine](size_t count) -> size_t
    {
        std::uniform_int_distribution<size_t> dist(0, count - 1);
        return dist(*engine);
    };
}

} // namespace

IndexPicker make_uniform_picker()
{
    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return picker_from_engine(std::make_shared<std::mt19937_64>(seq));
}

IndexPicker make_uniform_picker(std::uint64_t seed)
{
    return picker_from_engine(std::make_shared<std::mt19937_64>(seed));
}

Scheduler::Scheduler(IndexPicker picker)
    : m_picker{picker ? std::move(picker) : make_uniform_picker()}
{}

std::vector<StepIdx> Scheduler::eligible(const Plan& plan)
{
    std::vector<StepIdx> result;
    for (StepIdx sidx = 0; sidx < plan.step_count(); ++sidx)
    {
        const Step& candidate = plan.step(sidx);
        if (!candidate.is_pending())
        {
            continue;
        }

        bool can_run = true;
        for (const auto& pred_id : candidate.predecessors())
        {
            auto pred = plan.find_step(pred_id);
            if (!pred.has_value() || plan.step(*pred).state() != StepState::Done)
            {
                can_run = false;
                break;
            }
        }

        if (can_run)
        {
            result.push_back(sidx);
        }
    }
    return result;
}

std::optional<StepIdx> Scheduler::select_next(const Plan& plan)
{
    std::vector<StepIdx> candidates = eligible(plan);
    if (candidates.empty())
    {
        return std::nullopt;
    }

    size_t pick = m_picker(candidates.size());
    if (pick >= candidates.size())
    {
        throw std::out_of_range(
            "Index picker returned " + std::to_string(pick) + " for " +
            std::to_string(candidates.size()) + " candidates");
    }
    spdlog::debug("{} eligible step(s), picked {}", candidates.size(),
                  plan.step(candidates[pick]).id());
    return candidates[pick];
}

} // namespace runplan
