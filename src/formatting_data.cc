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

#include "formatting_data.h"

#include <algorithm>
#include <cassert>
#include <cstring>
#include <utility>

#ifndef BYTENUM_ASSERT
#define BYTENUM_ASSERT(X) assert(X)
#endif

using bytenum::BuildStatus;
using bytenum::DecodeCursor;
using bytenum::DecodeResult;
using bytenum::DecodeStatus;
using bytenum::FormattingData;
using bytenum::SymbolCodes;
using bytenum::WriteResult;
using bytenum::WriteStatus;

//==================================================================================================
// Construction
//==================================================================================================

BuildStatus FormattingData::Create(const SymbolCodes& codes, Encoding encoding, FormattingData& result)
{
    FormattingData fd;
    fd.encoding_ = encoding;

    for (int i = 0; i < SymbolCount; ++i)
    {
        if (!codes[i])
            continue;

        const std::vector<uint8_t>& code = *codes[i];
        if (code.empty())
            return BuildStatus::empty_code;

        fd.offsets_[i] = static_cast<int>(fd.bytes_.size());
        fd.lengths_[i] = static_cast<int>(code.size());
        fd.bytes_.insert(fd.bytes_.end(), code.begin(), code.end());
    }

    // Symbols are inserted in order of their ids. The top-level list is kept sorted, so that
    // collisions are detected as soon as they occur.
    for (int i = 0; i < SymbolCount; ++i)
    {
        if (fd.lengths_[i] == 0)
            continue;

        const BuildStatus status = fd.Insert(-1, i, 0);
        if (status != BuildStatus::ok)
            return status;
    }

    result = std::move(fd);
    return BuildStatus::ok;
}

int FormattingData::KeyAt(int symbol, int level) const
{
    BYTENUM_ASSERT(lengths_[symbol] > 0);

    if (level >= lengths_[symbol])
        return EndOfCode;

    return bytes_[static_cast<size_t>(offsets_[symbol] + level)];
}

std::vector<int>& FormattingData::Children(int parent)
{
    return parent < 0 ? roots_ : nodes_[static_cast<size_t>(parent)].children;
}

const std::vector<int>& FormattingData::Children(int parent) const
{
    return parent < 0 ? roots_ : nodes_[static_cast<size_t>(parent)].children;
}

// Returns the position of the node with the given key in 'list', or -1.
int FormattingData::Find(const std::vector<int>& list, int key) const
{
    const auto it = std::lower_bound(list.begin(), list.end(), key, [this](int node, int k) {
        return nodes_[static_cast<size_t>(node)].key < k;
    });

    if (it == list.end() || nodes_[static_cast<size_t>(*it)].key != key)
        return -1;

    return static_cast<int>(it - list.begin());
}

// Inserts 'symbol' below 'parent', where 'level' is the depth of the children of 'parent'.
BuildStatus FormattingData::Insert(int parent, int symbol, int level)
{
    const int key = KeyAt(symbol, level);

    std::vector<int>& list = Children(parent);
    const auto it = std::lower_bound(list.begin(), list.end(), key, [this](int node, int k) {
        return nodes_[static_cast<size_t>(node)].key < k;
    });

    if (it == list.end() || nodes_[static_cast<size_t>(*it)].key != key)
    {
        const auto pos = it - list.begin();

        // NB: push_back invalidates 'list' if parent >= 0.
        nodes_.push_back(TrieNode{key, symbol, {}});
        std::vector<int>& children = Children(parent);
        children.insert(children.begin() + pos, static_cast<int>(nodes_.size() - 1));
        return BuildStatus::ok;
    }

    const int hit = *it;
    TrieNode& node = nodes_[static_cast<size_t>(hit)];
    if (!node.IsLeaf())
    {
        return Insert(hit, symbol, level + 1);
    }

    if (key == EndOfCode)
    {
        // Both byte sequences end here.
        return BuildStatus::duplicate_code;
    }

    // Turn the leaf into a branch and move both symbols one level down.
    const int other = node.symbol;
    node.symbol = -1;

    const BuildStatus status = Insert(hit, other, level + 1);
    if (status != BuildStatus::ok)
        return status;

    return Insert(hit, symbol, level + 1);
}

//==================================================================================================
// Queries
//==================================================================================================

bool FormattingData::IsInvariantUtf8() const
{
    const FormattingData& fd = InvariantUtf8();
    return encoding_ == fd.encoding_ && lengths_ == fd.lengths_ && bytes_ == fd.bytes_;
}

bool FormattingData::IsInvariantUtf16() const
{
    const FormattingData& fd = InvariantUtf16();
    return encoding_ == fd.encoding_ && lengths_ == fd.lengths_ && bytes_ == fd.bytes_;
}

bool FormattingData::HasSymbol(int symbol) const
{
    return CodeLength(symbol) != 0;
}

int FormattingData::CodeLength(int symbol) const
{
    if (symbol < 0 || symbol >= SymbolCount)
        return 0;

    return lengths_[symbol];
}

const uint8_t* FormattingData::Code(int symbol) const
{
    if (CodeLength(symbol) == 0)
        return nullptr;

    return bytes_.data() + offsets_[symbol];
}

//==================================================================================================
// Decode
//==================================================================================================

DecodeResult FormattingData::Feed(DecodeCursor& cursor, uint8_t byte) const
{
    const std::vector<int>& candidates = Children(cursor.node);

    const int pos = Find(candidates, byte);
    if (pos < 0)
    {
        // Sorted first, if present.
        const int front = candidates.empty() ? -1 : candidates.front();
        cursor.Reset();

        if (front >= 0 && nodes_[static_cast<size_t>(front)].key == EndOfCode)
        {
            const int symbol = nodes_[static_cast<size_t>(front)].symbol;
            return {DecodeStatus::matched, symbol, lengths_[symbol]};
        }

        return {DecodeStatus::invalid, -1, 0};
    }

    const int index = candidates[static_cast<size_t>(pos)];
    const TrieNode& node = nodes_[static_cast<size_t>(index)];
    if (node.IsLeaf())
    {
        cursor.Reset();
        return {DecodeStatus::matched, node.symbol, lengths_[node.symbol]};
    }

    cursor.node = index;
    cursor.depth++;
    return {DecodeStatus::need_more, -1, 0};
}

DecodeResult FormattingData::Decode(DecodeCursor& cursor, const uint8_t*& next, const uint8_t* last) const
{
    for ( ; next != last; ++next)
    {
        const int fed = cursor.depth + 1;

        const DecodeResult res = Feed(cursor, *next);
        switch (res.status)
        {
        case DecodeStatus::need_more:
            break;
        case DecodeStatus::matched:
            if (res.length >= fed)
                ++next;
            return res;
        case DecodeStatus::invalid:
            return res;
        }
    }

    return {DecodeStatus::need_more, -1, 0};
}

DecodeResult FormattingData::Finish(DecodeCursor& cursor) const
{
    if (cursor.AtStart())
        return {DecodeStatus::invalid, -1, 0};

    const std::vector<int>& candidates = Children(cursor.node);
    cursor.Reset();

    BYTENUM_ASSERT(!candidates.empty());
    const TrieNode& front = nodes_[static_cast<size_t>(candidates.front())];
    if (front.key != EndOfCode)
        return {DecodeStatus::invalid, -1, 0};

    return {DecodeStatus::matched, front.symbol, lengths_[front.symbol]};
}

bool FormattingData::Verify(const uint8_t* buffer, int length, int index, int symbol, int bytes_consumed) const
{
    const int code_length = CodeLength(symbol);
    if (code_length == 0 || bytes_consumed < 0 || bytes_consumed > code_length)
        return false;

    const int remaining = code_length - bytes_consumed;
    if (remaining == 0)
        return true;

    if (index < 0 || index > length || length - index < remaining)
        return false;

    return std::memcmp(buffer + index, Code(symbol) + bytes_consumed, static_cast<size_t>(remaining)) == 0;
}

//==================================================================================================
// Encode
//==================================================================================================

WriteResult FormattingData::Write(int symbol, uint8_t* buffer, int buffer_length) const
{
    const int code_length = CodeLength(symbol);
    if (code_length == 0)
        return {0, WriteStatus::undefined_symbol};

    if (code_length > buffer_length)
        return {0, WriteStatus::insufficient_space};

    const uint8_t* code = Code(symbol);
    switch (code_length)
    {
    case 2:
        buffer[1] = code[1];
        // fall through
    case 1:
        buffer[0] = code[0];
        break;
    default:
        std::memcpy(buffer, code, static_cast<size_t>(code_length));
        break;
    }

    return {code_length, WriteStatus::ok};
}

WriteResult FormattingData::WriteDigit(int digit, uint8_t* buffer, int buffer_length) const
{
    BYTENUM_ASSERT(digit >= 0);
    BYTENUM_ASSERT(digit < 10);

    return Write(digit, buffer, buffer_length);
}

//==================================================================================================
// Dump
//==================================================================================================

void FormattingData::DumpNode(std::FILE* file, int node, int level) const
{
    const TrieNode& n = nodes_[static_cast<size_t>(node)];

    std::fprintf(file, "%*s", 2 * level, "");
    if (n.key == EndOfCode)
        std::fprintf(file, "<end>");
    else
        std::fprintf(file, "0x%02X", n.key);

    if (n.IsLeaf())
    {
        std::fprintf(file, " -> %d\n", n.symbol);
        return;
    }

    std::fprintf(file, "\n");
    for (const int child : n.children)
    {
        DumpNode(file, child, level + 1);
    }
}

void FormattingData::Dump(std::FILE* file) const
{
    std::fprintf(file, "FormattingData (%s): %d nodes\n", IsUtf8() ? "utf8" : "utf16", static_cast<int>(nodes_.size()));
    for (const int root : roots_)
    {
        DumpNode(file, root, 1);
    }
}

//==================================================================================================
// Invariant tables
//==================================================================================================

static FormattingData MakeInvariant(bytenum::Encoding encoding)
{
    static constexpr const char* Ascii[bytenum::SymbolCount] = {
        "0", "1", "2", "3", "4", "5", "6", "7", "8", "9",
        ".",        // decimal separator
        ",",        // group separator
        "Infinity",
        "-",        // minus sign
        "+",        // plus sign
        "NaN",
        "E",        // exponent
        "e",        // exponent (secondary)
    };

    SymbolCodes codes;
    for (int i = 0; i < bytenum::SymbolCount; ++i)
    {
        std::vector<uint8_t> code;
        for (const char* p = Ascii[i]; *p != '\0'; ++p)
        {
            code.push_back(static_cast<uint8_t>(*p));
            if (encoding == bytenum::Encoding::utf16)
                code.push_back(0);
        }
        codes[i] = std::move(code);
    }

    FormattingData fd;
    const BuildStatus status = FormattingData::Create(codes, encoding, fd);
    BYTENUM_ASSERT(status == BuildStatus::ok);
    static_cast<void>(status);

    return fd;
}

const FormattingData& bytenum::InvariantUtf8()
{
    static const FormattingData fd = MakeInvariant(Encoding::utf8);
    return fd;
}

const FormattingData& bytenum::InvariantUtf16()
{
    static const FormattingData fd = MakeInvariant(Encoding::utf16);
    return fd;
}
