// Copyright 2017 Alexander Bolz
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.

#pragma once

#include <array>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <vector>

namespace bytenum {

enum class Encoding {
    utf16 = 0,
    utf8 = 1,
};

// Symbol ids 0...9 are the digits '0'...'9'.
enum class Symbol {
    decimal_separator = 10,
    group_separator = 11,
    infinity = 12,
    minus_sign = 13,
    plus_sign = 14,
    nan = 15,
    exponent = 16,
    exponent_secondary = 17,
};

constexpr int SymbolCount = 18;

// The byte sequence of each digit and symbol, indexed by symbol id.
// An empty optional means that the table does not define this symbol.
using SymbolCodes = std::array<std::optional<std::vector<uint8_t>>, SymbolCount>;

enum class BuildStatus {
    ok,
    duplicate_code, // two symbols have identical byte sequences
    empty_code,     // a defined symbol has an empty byte sequence
};

// Decoder state, held by the caller between calls to Feed/Decode/Finish.
struct DecodeCursor
{
    int node = -1;  // current branch, or -1 if no byte of the current symbol has been seen yet
    int depth = 0;  // number of bytes of the current symbol fed so far

    bool AtStart() const { return node < 0; }
    void Reset() { node = -1; depth = 0; }
};

enum class DecodeStatus {
    matched,
    need_more,
    invalid,
};

struct DecodeResult
{
    DecodeStatus status;
    int symbol; // symbol id, if matched
    int length; // length of the symbol's byte sequence, if matched
};

enum class WriteStatus {
    ok,
    insufficient_space,
    undefined_symbol,
};

struct WriteResult
{
    int bytes_written;
    WriteStatus status;

    // Test for success.
    explicit operator bool() const noexcept
    {
        return status == WriteStatus::ok;
    }
};

//==================================================================================================
// FormattingData
//
// Maps digits and symbols to byte sequences (encode) and recognizes these byte sequences one byte
// at a time (decode).
//
// Decoding uses a trie which is built once, when the table is created. Each node of the trie is
// keyed by the next byte of a sequence; the children of each node are sorted by key. A sequence
// which is a strict prefix of another sequence is stored below an end-of-code key which sorts
// before all byte values.
//
// A FormattingData is immutable after construction and may be shared between threads.
//==================================================================================================
class FormattingData
{
public:
    // Creates an empty table which defines no symbols.
    FormattingData() = default;

    // Builds a table from the given byte sequences.
    // On failure 'result' is not modified.
    static BuildStatus Create(const SymbolCodes& codes, Encoding encoding, FormattingData& result);

    Encoding encoding() const { return encoding_; }

    bool IsUtf8() const { return encoding_ == Encoding::utf8; }
    bool IsUtf16() const { return encoding_ == Encoding::utf16; }

    // Returns whether this table contains the same byte sequences as the invariant tables.
    bool IsInvariantUtf8() const;
    bool IsInvariantUtf16() const;

    bool HasSymbol(int symbol) const;
    bool HasSymbol(Symbol symbol) const { return HasSymbol(static_cast<int>(symbol)); }

    // Returns the length of the byte sequence of the given symbol, or 0 if undefined.
    int CodeLength(int symbol) const;

    // Returns the byte sequence of the given symbol, or nullptr if undefined.
    const uint8_t* Code(int symbol) const;

    // DecodeResult res = Feed(cursor, byte);
    //
    // Advances the decoder by a single byte.
    //  - need_more: the bytes fed so far are a proper prefix of (at least) one byte sequence.
    //    The cursor has been advanced; feed the next byte.
    //  - matched: res.symbol has been recognized. Its byte sequence is res.length bytes long.
    //    If res.length is larger than the number of bytes fed so far (cursor.depth + 1 before the
    //    call), the sequence was already unique and the trailing bytes have not been seen; use
    //    Verify to check them. If res.length is less than that, the recognized sequence is a
    //    prefix of another one and 'byte' does not belong to it.
    //  - invalid: no byte sequence starts with the bytes fed so far.
    // A miss at a node where a shorter sequence ends is not 'invalid': it yields 'matched' for
    // that shorter sequence, with 'byte' left unconsumed.
    // In the latter two cases the cursor is reset.
    DecodeResult Feed(DecodeCursor& cursor, uint8_t byte) const;

    // DecodeResult res = Decode(cursor, next, last);
    //
    // Feeds the bytes in [next, last) until a symbol is matched, the input is invalid, or the
    // input is exhausted (need_more). 'next' is advanced past the bytes which have been fed and
    // belong to the current symbol; on failure it points to the byte which did not match.
    // As with Feed, a matched sequence may be longer than the bytes fed so far.
    DecodeResult Decode(DecodeCursor& cursor, const uint8_t*& next, const uint8_t* last) const;

    // DecodeResult res = Finish(cursor);
    //
    // Signals the end of the input. Returns matched if the bytes fed so far form a complete byte
    // sequence which is also a prefix of another one, and invalid otherwise.
    // The cursor is reset.
    DecodeResult Finish(DecodeCursor& cursor) const;

    // Returns whether the bytes buffer[index...] match the trailing bytes of the byte sequence
    // of 'symbol', of which the first 'bytes_consumed' bytes have already been recognized.
    bool Verify(const uint8_t* buffer, int length, int index, int symbol, int bytes_consumed) const;

    // Copies the byte sequence of 'symbol' into the buffer.
    // Nothing is written if the buffer is too small.
    WriteResult Write(int symbol, uint8_t* buffer, int buffer_length) const;

    // PRE: digit < 10
    WriteResult WriteDigit(int digit, uint8_t* buffer, int buffer_length) const;

    WriteResult WriteSymbol(Symbol symbol, uint8_t* buffer, int buffer_length) const {
        return Write(static_cast<int>(symbol), buffer, buffer_length);
    }

    // Prints the decode trie.
    void Dump(std::FILE* file) const;

private:
    static constexpr int EndOfCode = -1;

    struct TrieNode
    {
        int key;               // byte value, or EndOfCode
        int symbol;            // symbol id, if this is a leaf
        std::vector<int> children; // indices into nodes_, sorted by key, if this is a branch

        bool IsLeaf() const { return children.empty(); }
    };

    int KeyAt(int symbol, int level) const;
    std::vector<int>& Children(int parent);
    const std::vector<int>& Children(int parent) const;
    int Find(const std::vector<int>& list, int key) const;
    BuildStatus Insert(int parent, int symbol, int level);
    void DumpNode(std::FILE* file, int node, int level) const;

    std::vector<uint8_t> bytes_;
    std::array<int, SymbolCount> offsets_ = {};
    std::array<int, SymbolCount> lengths_ = {}; // 0 if undefined
    std::vector<TrieNode> nodes_;
    std::vector<int> roots_; // top-level nodes, sorted by key
    Encoding encoding_ = Encoding::utf8;
};

// The invariant tables map the ASCII characters
//  "0" ... "9", ".", ",", "Infinity", "-", "+", "NaN", "E", "e"
// to their UTF-8 resp. UTF-16LE encodings.
// They are built on first use; initialization is thread-safe.
const FormattingData& InvariantUtf8();
const FormattingData& InvariantUtf16();

} // namespace bytenum
