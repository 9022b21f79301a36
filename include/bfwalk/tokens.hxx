#pragma once

#include <cstddef>
#include <string_view>

namespace bfwalk {

// One-shot cursor over raw instruction bytes. The source must outlive it.
class TokenSource {
   public:
    explicit TokenSource(std::string_view code) noexcept : code(code) {}

    bool hasMore() const noexcept { return pos < code.size(); }
    char next() noexcept { return code[pos++]; }
    std::size_t offset() const noexcept { return pos; }

   private:
    std::string_view code;
    std::size_t pos = 0;
};

}  // namespace bfwalk
