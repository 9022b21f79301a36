#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

namespace bfwalk {
enum class Status : int;
struct node;

/// @brief Runtime state of a single run: tape, cell pointer, cycle budget and the I/O handles.
///
/// Cell writes wrap modulo 256 and pointer writes wrap modulo the tape length, so neither can
/// leave its range. Reads from a missing or exhausted input yield 0. Every byte written is
/// flushed immediately.
class Context {
   public:
    /// @param tapeSize Number of cells; 0 falls back to BFWALK_DEFAULT_TAPE_SIZE with a warning.
    /// @param in Input stream, may be null.
    /// @param initialTape Bytes copied to the start of the tape, truncated to the tape length.
    Context(std::size_t tapeSize, std::uint64_t cycleLimit, std::istream* in, std::ostream& out,
            std::string_view initialTape = {});

    uint8_t cell() const noexcept { return tape[ptr]; }
    void setCell(int value) noexcept { tape[ptr] = static_cast<uint8_t>(value & 0xFF); }

    std::size_t pointer() const noexcept { return ptr; }
    void setPointer(std::ptrdiff_t value) noexcept;

    uint8_t readByte();
    void writeByte(uint8_t value);

    /// @brief Charges one cycle and runs the node. Fails with Status::CycleLimit, without running
    /// anything, once the budget is spent.
    Status execute(const node& n);

    std::uint64_t cyclesLeft() const noexcept { return cycles; }
    std::uint64_t cyclesUsed() const noexcept { return limit - cycles; }

    const std::vector<uint8_t>& cells() const noexcept { return tape; }
    std::size_t tapeSize() const noexcept { return tape.size(); }

   private:
    std::vector<uint8_t> tape;
    std::size_t ptr = 0;
    std::uint64_t limit;
    std::uint64_t cycles;
    std::istream* in;
    std::ostream& out;
};

}  // namespace bfwalk
