#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

// Thrown by cache construction when the requested capacity is not positive.
class InvalidCapacity : public std::invalid_argument {
public:
    explicit InvalidCapacity(int capacity)
        : std::invalid_argument("invalid capacity: " + std::to_string(capacity)),
          capacity_(capacity) {}

    int capacity() const { return capacity_; }

private:
    int capacity_;
};

#endif // CACHEERRORS_HPP
