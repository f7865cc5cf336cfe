#pragma once

#include <chrono>
#include <cstdint>

namespace labgate {
namespace common {

// 可注入的时钟, 便于测试中控制时间
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual TimePoint Now() const = 0;

    std::int64_t NowSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(Now().time_since_epoch()).count();
    }
};

class SystemClock : public Clock {
public:
    TimePoint Now() const override {
        return std::chrono::system_clock::now();
    }
};

}
}
