#include "riftcrawl/repository.hpp"

namespace riftcrawl {

MatchCursor::MatchCursor(Repository& repo, std::size_t offset, std::size_t page_size)
    : repo_(repo), page_size_(page_size == 0 ? 1 : page_size), position_(offset) {}

std::optional<MatchRecord> MatchCursor::next() {
    if (!started_) {
        started_ = true;
        if (position_ > 0) {
            last_key_ = repo_.match_key_at(position_ - 1);
            if (!last_key_) exhausted_ = true;
        }
    }

    if (page_index_ >= page_.size()) {
        if (exhausted_) return std::nullopt;
        page_ = repo_.read_matches(last_key_, page_size_);
        page_index_ = 0;
        if (page_.empty()) {
            exhausted_ = true;
            return std::nullopt;
        }
    }

    auto record = std::move(page_[page_index_++]);
    last_key_ = record.ref;
    ++position_;
    return record;
}

} // namespace riftcrawl
