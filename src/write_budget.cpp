#include "write_budget.hpp"

#include <algorithm>

namespace realtime
{

    bool WriteBudget::admit(std::size_t bytes, Clock::time_point now, std::chrono::milliseconds timeout)
    {
        if (m_overSince && now - *m_overSince > timeout)
            return false;

        m_backlog += bytes;
        if (m_backlog > m_limit && !m_overSince)
            m_overSince = now;
        return true;
    }

    bool WriteBudget::startPing()
    {
        if (m_pingOutstanding || m_backlog == 0)
            return false;
        m_pingOutstanding = true;
        m_pingCovers      = m_backlog;
        return true;
    }

    void WriteBudget::acknowledge()
    {
        if (!m_pingOutstanding)
            return;
        m_backlog -= std::min(m_pingCovers, m_backlog);
        m_pingCovers      = 0;
        m_pingOutstanding = false;
        if (m_backlog <= m_limit)
            m_overSince.reset();
    }

} // namespace realtime
