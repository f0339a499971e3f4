#pragma once

#include <backend/progress/progress_meter.hpp>

#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief The meters currently shown. Meters only leave through prune().
 */
class ProgressRegistry
{
  public:
    void add(std::shared_ptr<ProgressMeter> meter);

    /**
     * @brief Copy of the current set of meters in insertion order.
     */
    std::vector<std::shared_ptr<ProgressMeter>> snapshot() const;

    /**
     * @brief Removes all finished meters.
     *
     * @return The amount of meters removed.
     */
    std::size_t prune();

    bool empty() const;
    std::size_t size() const;

  private:
    mutable std::mutex guard_;
    std::vector<std::shared_ptr<ProgressMeter>> meters_;
};
