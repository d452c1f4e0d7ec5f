#pragma once
#include <string>
#include <utility>
#include <variant>

namespace morpheus
{

  using Unit = std::monostate;

  // Value-or-error for operations that are not part of a transaction.
  template <typename T, typename E>
  class [[nodiscard]] Result
  {
  public:
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isOk() const { return v_.index() == 0; }
    explicit operator bool() const { return isOk(); }

    T &value() & { return std::get<0>(v_); }
    const T &value() const & { return std::get<0>(v_); }
    T &&value() && { return std::get<0>(std::move(v_)); }
    const E &error() const { return std::get<1>(v_); }

  private:
    template <size_t I, typename A>
    Result(std::in_place_index_t<I> tag, A &&a) : v_(tag, std::forward<A>(a)) {}

    std::variant<T, E> v_;
  };

  // Outcome of a transactional operation.
  //
  // Ok(T)     the step succeeded inside the current transaction.
  // Retry     the transaction engine aborted; the invoker must re-run the
  //           whole enclosing closure. Never a reason to report an error.
  // Fatal(E)  a validation, storage, transport or domain failure; must not be
  //           retried and must be surfaced to the caller.
  template <typename T, typename E>
  class [[nodiscard]] TxnOutcome
  {
  public:
    struct Retry
    {
      std::string reason;
    };

    static TxnOutcome ok(T value) { return TxnOutcome(std::in_place_index<0>, std::move(value)); }
    static TxnOutcome retry(std::string reason = {}) { return TxnOutcome(std::in_place_index<1>, Retry{std::move(reason)}); }
    static TxnOutcome fatal(E error) { return TxnOutcome(std::in_place_index<2>, std::move(error)); }

    bool isOk() const { return v_.index() == 0; }
    bool isRetry() const { return v_.index() == 1; }
    bool isFatal() const { return v_.index() == 2; }

    T &value() & { return std::get<0>(v_); }
    const T &value() const & { return std::get<0>(v_); }
    T &&value() && { return std::get<0>(std::move(v_)); }
    const std::string &reason() const { return std::get<1>(v_).reason; }
    const E &error() const { return std::get<2>(v_); }

    // re-types a Retry/Fatal outcome for early return; must not be called on Ok
    template <typename U>
    TxnOutcome<U, E> as() const
    {
      if (isRetry())
        return TxnOutcome<U, E>::retry(reason());
      return TxnOutcome<U, E>::fatal(error());
    }

  private:
    template <size_t I, typename A>
    TxnOutcome(std::in_place_index_t<I> tag, A &&a) : v_(tag, std::forward<A>(a)) {}

    std::variant<T, Retry, E> v_;
  };

} // namespace morpheus
