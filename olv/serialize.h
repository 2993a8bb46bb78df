// *****************************************************************************
// * This file is part of the ObjectListView project. It is distributed under  *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) ObjectListView contributors - All Rights Reserved           *
// *****************************************************************************

#ifndef SERIALIZE_H_1180356487203748123
#define SERIALIZE_H_1180356487203748123

#include <algorithm>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include "error.h"


namespace olv
{
/*  binary serialization of settings blobs (e.g. column state)

    ----------------------------------
    | Buffered Input Stream Concept  |
    ----------------------------------
        size_t read(void* buffer, size_t bytesToRead); //return "bytesToRead" bytes unless end of stream!

    ----------------------------------
    | Buffered Output Stream Concept |
    ----------------------------------
        void write(const void* buffer, size_t bytesToWrite);            */

struct MemoryStreamIn
{
    explicit MemoryStreamIn(const std::string_view& stream) : memRef_(stream) {}

    MemoryStreamIn(std::string&&) = delete; //careful: do NOT store reference to a temporary!

    size_t read(void* buffer, size_t bytesToRead)
    {
        const size_t junkSize = std::min(bytesToRead, memRef_.size() - pos_);
        std::memcpy(buffer, memRef_.data() + pos_, junkSize);
        pos_ += junkSize;
        return junkSize;
    }

    size_t pos() const { return pos_; }
    bool atEnd() const { return pos_ == memRef_.size(); }

private:
    MemoryStreamIn& operator=(const MemoryStreamIn&) = delete;

    const std::string_view memRef_;
    size_t pos_ = 0;
};


struct MemoryStreamOut
{
    MemoryStreamOut() = default;

    void write(const void* buffer, size_t bytesToWrite)
    {
        memBuf_.append(static_cast<const char*>(buffer), bytesToWrite);
    }

    const std::string& ref() const { return memBuf_; }
    /**/  std::string& ref()       { return memBuf_; }

private:
    MemoryStreamOut           (const MemoryStreamOut&) = delete;
    MemoryStreamOut& operator=(const MemoryStreamOut&) = delete;

    std::string memBuf_;
};

//-------------------------------------------------------------------------------------

struct UnexpectedEndOfStream : public OlvError
{
    UnexpectedEndOfStream() : OlvError(_("Unexpected end of stream.")) {}
};

template <class N, class BufferedOutputStream> void writeNumber(BufferedOutputStream& stream, const N& num);

template <class N, class BufferedInputStream> N readNumber(BufferedInputStream& stream); //throw UnexpectedEndOfStream (corrupted data)




//-------------------------------------------------------------------------------------

template <class BufferedOutputStream> inline
void writeArray(BufferedOutputStream& stream, const void* buffer, size_t len)
{
    stream.write(buffer, len);
}


template <class N, class BufferedOutputStream> inline
void writeNumber(BufferedOutputStream& stream, const N& num)
{
    static_assert(std::is_arithmetic_v<N> || std::is_enum_v<N>);
    stream.write(&num, sizeof(N));
}


template <class BufferedInputStream> inline
void readArray(BufferedInputStream& stream, void* buffer, size_t len) //throw UnexpectedEndOfStream
{
    if (stream.read(buffer, len) < len)
        throw UnexpectedEndOfStream();
}


template <class N, class BufferedInputStream> inline
N readNumber(BufferedInputStream& stream) //throw UnexpectedEndOfStream
{
    static_assert(std::is_arithmetic_v<N> || std::is_enum_v<N>);
    N num; //uninitialized
    readArray(stream, &num, sizeof(N));
    return num;
}
}

#endif //SERIALIZE_H_1180356487203748123
