// Builder-style option accessors. Included by option headers; every header
// that includes this file undefines the macro at its end.
#define ADD_ARG(T, name)                                           \
 public:                                                           \
  inline auto name(const T& new_##name) -> decltype(*this) {      \
    this->name##_ = new_##name;                                    \
    return *this;                                                  \
  }                                                                \
  inline const T& name() const noexcept { return this->name##_; } \
  inline T& name() noexcept { return this->name##_; }             \
                                                                   \
 private:                                                          \
  T name##_
