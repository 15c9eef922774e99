#include "vote_smoother.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace signrec
{

    VoteSmoother::VoteSmoother(size_t capacity)
        : capacity_(std::max<size_t>(1, capacity))
    {
    }

    std::string VoteSmoother::add(const std::string &label)
    {
        history_.push_back(label);
        if (history_.size() > capacity_)
        {
            history_.pop_front();
        }
        return resolve();
    }

    std::string VoteSmoother::resolve() const
    {
        if (history_.empty())
        {
            return {};
        }

        // Frequency table in first-seen order. History is small (tens of
        // entries), a linear table keeps the order explicit.
        std::vector<std::pair<std::string, size_t>> counts;
        for (const auto &label : history_)
        {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&label](const std::pair<std::string, size_t> &e)
                                   { return e.first == label; });
            if (it == counts.end())
            {
                counts.emplace_back(label, 1);
            }
            else
            {
                ++it->second;
            }
        }

        // Strictly greater: first-seen label keeps the tie
        const std::pair<std::string, size_t> *best = &counts.front();
        for (const auto &entry : counts)
        {
            if (entry.second > best->second)
            {
                best = &entry;
            }
        }
        return best->first;
    }

    size_t VoteSmoother::count(const std::string &label) const
    {
        return static_cast<size_t>(std::count(history_.begin(), history_.end(), label));
    }

} // namespace signrec
