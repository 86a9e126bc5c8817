//
// Number formatting for Core::PrintStream
//

#include <core/PrintStream.h>

namespace {
    constexpr const char* digits = "0123456789abcdef";

    template <class T>
    int itoa(T value, char* str, int base){
        if(value == 0){
            str[0] = '0';
            str[1] = 0;
            return 1;
        }
        int len = 0;
        bool negative = false;
        if constexpr (static_cast<T>(-1) < static_cast<T>(0)){
            if(value < 0){
                negative = true;
            }
        }
        while(value != 0){
            T digit = value % static_cast<T>(base);
            if(digit < 0) digit = -digit;
            str[len] = digits[digit];
            value /= static_cast<T>(base);
            len++;
        }
        if(negative){
            str[len++] = '-';
        }
        for(int i = 0; i < len/2; i++){
            char a = str[i];
            char b = str[len - i - 1];
            str[len - i - 1] = a;
            str[i] = b;
        }
        str[len] = 0;
        return len;
    }

    //Unsigned only; writes exactly length digits, zero padded on the left
    template <class T>
    void paddedItoa(T value, char* str, int base, int length){
        for(int i = 0; i < length; i++){
            str[i] = '0';
        }
        str[length] = 0;
        for(int i = length - 1; i >= 0 && value != 0; i--){
            str[i] = digits[value % static_cast<T>(base)];
            value /= static_cast<T>(base);
        }
    }
}

namespace Core{

    PrintStream& PrintStream::operator<<(const char c){
        char str[2] = {c, 0};
        putString(str);
        return *this;
    }

    PrintStream& PrintStream::operator<<(const char* str){
        putString(str);
        return *this;
    }

    PrintStream& PrintStream::operator<<(const void* ptr){
        char strbuff[sizeof(uint64_t) * 2 + 1];
        paddedItoa(reinterpret_cast<uint64_t>(ptr), strbuff, 16, sizeof(uint64_t) * 2);
        return *this << "0x" << strbuff;
    }

    PrintStream& PrintStream::operator<<(const uint8_t x){
        char strbuff[sizeof(uint8_t) * 3 + 1];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const uint16_t x){
        char strbuff[sizeof(uint16_t) * 3 + 1];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const uint32_t x){
        char strbuff[sizeof(uint32_t) * 3 + 1];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const uint64_t x){
        char strbuff[sizeof(uint64_t) * 3 + 1];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const int16_t x){
        char strbuff[sizeof(int16_t) * 3 + 2];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const int32_t x){
        char strbuff[sizeof(int32_t) * 3 + 2];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const int64_t x){
        char strbuff[sizeof(int64_t) * 3 + 2];
        itoa(x, strbuff, 10);
        return *this << strbuff;
    }

    PrintStream& PrintStream::operator<<(const bool x){
        if(x){
            *this << "true";
        }
        else{
            *this << "false";
        }
        return *this;
    }
}
