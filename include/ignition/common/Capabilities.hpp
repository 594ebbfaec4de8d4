#pragma once

namespace ignition {

// Resettable: экземпляр умеет возвращаться в чистое состояние перед повторной выдачей
class Resettable {
public:
    virtual ~Resettable() = default;
    virtual void reset() = 0;
};

// Cleanable: экземпляр освобождает ресурсы при выгрузке/вытеснении
class Cleanable {
public:
    virtual ~Cleanable() = default;
    virtual void cleanup() = 0;
};

} // namespace ignition
