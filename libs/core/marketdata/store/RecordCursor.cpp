#include "RecordCursor.hpp"
#include <utility>

RecordCursor::RecordCursor(std::shared_ptr<IRecordPager> pager, std::size_t pageSize)
    : m_pager(std::move(pager))
    , m_pageSize(pageSize == 0 ? kDefaultPageSize : pageSize)
{
    m_exhausted = (m_pager == nullptr);
}

std::optional<StoredRecord> RecordCursor::next() {
    if (m_page.empty() && !m_exhausted) {
        auto page = m_pager->fetchPage(m_last, m_pageSize);
        if (page.size() < m_pageSize) {
            m_exhausted = true;
        }
        for (auto& r : page) {
            m_page.push_back(std::move(r));
        }
    }
    if (m_page.empty()) {
        m_exhausted = true;
        return std::nullopt;
    }

    StoredRecord r = std::move(m_page.front());
    m_page.pop_front();
    m_last = RecordKey{r.receivedAtUs, r.id};
    return r;
}

void RecordCursor::rewind() {
    m_page.clear();
    m_last.reset();
    m_exhausted = (m_pager == nullptr);
}

std::vector<StoredRecord> RecordCursor::collect() {
    std::vector<StoredRecord> out;
    while (auto r = next()) {
        out.push_back(std::move(*r));
    }
    return out;
}
