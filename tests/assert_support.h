//
// Turns Core/LibHeap assertions into exceptions the test runner can report
//

#ifndef HERON_ASSERT_SUPPORT_H
#define HERON_ASSERT_SUPPORT_H

#include <exception>
#include <string>
#include <sstream>

namespace HeronTest{
    class AssertionFailure : public std::exception {
    private:
        std::string message;
    public:
        explicit AssertionFailure(const std::string& msg) : message(msg) {}
        const char* what() const noexcept override { return message.c_str(); }
    };

    template<typename... Args>
    std::string formatAssertMessage(const Args&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }
}

#endif //HERON_ASSERT_SUPPORT_H
