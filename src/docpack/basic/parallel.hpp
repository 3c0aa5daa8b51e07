#pragma once
#include <exception>
#include <functional>
#include <future>
#include <iterator>
#include <type_traits>
#include <vector>

namespace DocPack
{

struct DefaultParallelExecutor {
    DefaultParallelExecutor() = default;
    template <typename Callable, typename... Args>
    auto execute(Callable&& f, Args&&... args) const -> std::future<std::invoke_result_t<Callable, Args...>> {
        return std::async(std::launch::async, std::forward<Callable>(f), std::forward<Args>(args)...);
    }
};

// runs everything on the calling thread, in group order
struct InlineParallelExecutor {
    template <typename Callable, typename... Args>
    auto execute(Callable&& f, Args&&... args) const -> std::future<std::invoke_result_t<Callable, Args...>> {
        return std::async(std::launch::deferred, std::forward<Callable>(f), std::forward<Args>(args)...);
    }
};

/// @brief parallel process task,the first exception thrown by any group is rethrown after all groups joined
/// @tparam Iterator random access iterator or integral index
/// @tparam ProcessF  with singature void(Iterator input,std::size_t dataSize,std::size_t groupIndex)
/// @param inputIt start iterator
/// @param endIt end iterrator which is reachable for inputIt with + operation
/// @param f date process function
/// @param groupSize partition datasheet size
template <typename Iterator, typename ProcessF, typename Executor = DefaultParallelExecutor>
inline void ParallelRun(Iterator inputIt,
                        Iterator endIt,
                        ProcessF f,
                        std::size_t groupSize   = 1,
                        const Executor& executor = Executor {}) {
    std::size_t total_size = 0;
    if constexpr (std::is_integral_v<std::decay_t<Iterator>>) {
        total_size = static_cast<std::size_t>(endIt - inputIt);
    } else {
        static_assert(std::is_same_v<typename std::iterator_traits<Iterator>::iterator_category,
                                     std::random_access_iterator_tag>,
                      "ParallelRun requires random access iterators");
        total_size = static_cast<std::size_t>(std::distance(inputIt, endIt));
    }
    if (total_size == 0) return;
    if (groupSize == 0) groupSize = total_size;
    auto groupNums = (total_size + groupSize - 1) / groupSize;

    std::vector<std::future<void>> tasks;
    tasks.reserve(groupNums > 0 ? groupNums - 1 : 0);
    for (std::size_t i = 1; i < groupNums; ++i) {
        auto offset           = i * groupSize;
        auto currentGroupSize = (total_size - offset) > groupSize ? groupSize : (total_size - offset);
        tasks.emplace_back(executor.execute(f, inputIt + offset, currentGroupSize, i));
    }

    std::exception_ptr eptr;
    try {
        // Run the first group on the current thread directly.
        f(inputIt, groupNums > 1 ? groupSize : total_size, static_cast<std::size_t>(0));
    } catch (...) {
        eptr = std::current_exception();
    }

    // Wait for all tasks to finish.
    for (auto& item : tasks) {
        try {
            item.get();
        } catch (...) {
            if (!eptr) eptr = std::current_exception();
        }
    }

    if (eptr) {
        std::rethrow_exception(eptr);
    }
}
} // namespace DocPack
