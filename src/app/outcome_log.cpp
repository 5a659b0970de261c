#include "outcome_log.h"

#include <algorithm>

namespace App
{
    void OutcomeLog::reset()
    {
        _entries.clear();
        _text.clear();
    }

    void OutcomeLog::append(size_t die_index, int face)
    {
        if (!_entries.empty())
        {
            _text.push_back('+');
        }
        _text += std::to_string(face);
        _entries.push_back(Entry{die_index, face});
    }

    void OutcomeLog::withdraw(size_t die_index)
    {
        const auto removed = std::remove_if(_entries.begin(), _entries.end(),
                                            [die_index](const Entry &e) { return e.die_index == die_index; });
        if (removed == _entries.end())
        {
            return;
        }
        _entries.erase(removed, _entries.end());
        rebuild_text();
    }

    std::vector<int> OutcomeLog::faces() const
    {
        std::vector<int> out;
        out.reserve(_entries.size());
        for (const Entry &e : _entries)
        {
            out.push_back(e.face);
        }
        return out;
    }

    void OutcomeLog::rebuild_text()
    {
        _text.clear();
        for (size_t i = 0; i < _entries.size(); ++i)
        {
            if (i > 0)
            {
                _text.push_back('+');
            }
            _text += std::to_string(_entries[i].face);
        }
    }
} // namespace App
