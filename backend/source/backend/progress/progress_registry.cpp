#include <backend/progress/progress_registry.hpp>

#include <algorithm>

void ProgressRegistry::add(std::shared_ptr<ProgressMeter> meter)
{
    if (!meter)
        return;
    std::scoped_lock lock{guard_};
    meters_.push_back(std::move(meter));
}

std::vector<std::shared_ptr<ProgressMeter>> ProgressRegistry::snapshot() const
{
    std::scoped_lock lock{guard_};
    return meters_;
}

std::size_t ProgressRegistry::prune()
{
    std::scoped_lock lock{guard_};
    return std::erase_if(meters_, [](auto const& meter) {
        return meter->isFinished();
    });
}

bool ProgressRegistry::empty() const
{
    std::scoped_lock lock{guard_};
    return meters_.empty();
}

std::size_t ProgressRegistry::size() const
{
    std::scoped_lock lock{guard_};
    return meters_.size();
}
