/// @file src/keeper/core/result.h
/// @brief Declarations for result.
/// @details A value-or-error holder used as the return type of every fallible
///          keeper operation. This file is part of the app_keeper supervisor.

#ifndef KEEPER_CORE_RESULT_H
#define KEEPER_CORE_RESULT_H

#include <new>
#include <stdexcept>
#include <utility>
#include "./error_code.h"

namespace keeper
{
    namespace core
    {
        /// @brief A wrapper that holds either a value or an error
        /// @tparam T Value type
        /// @tparam E Error type
        template <typename T, typename E = ErrorCode>
        class Result final
        {
        private:
            bool mHasValue;
            union
            {
                T mValue;
                E mError;
            };

            struct ValueTag
            {
            };
            struct ErrorTag
            {
            };

            template <typename... Args>
            Result(ValueTag, Args &&...args) : mHasValue{true}
            {
                new (&mValue) T(std::forward<Args>(args)...);
            }

            Result(ErrorTag, const E &error) : mHasValue{false}
            {
                new (&mError) E(error);
            }

            void destroy() noexcept
            {
                if (mHasValue)
                {
                    mValue.~T();
                }
                else
                {
                    mError.~E();
                }
            }

        public:
            /// @brief Construct a result holding a copied value
            Result(const T &value) : mHasValue{true}
            {
                new (&mValue) T(value);
            }

            /// @brief Construct a result holding a moved value
            Result(T &&value) : mHasValue{true}
            {
                new (&mValue) T(std::move(value));
            }

            /// @brief Construct a result holding an error
            explicit Result(const E &error) : mHasValue{false}
            {
                new (&mError) E(error);
            }

            Result(const Result &other) : mHasValue{other.mHasValue}
            {
                if (mHasValue)
                {
                    new (&mValue) T(other.mValue);
                }
                else
                {
                    new (&mError) E(other.mError);
                }
            }

            Result(Result &&other) : mHasValue{other.mHasValue}
            {
                if (mHasValue)
                {
                    new (&mValue) T(std::move(other.mValue));
                }
                else
                {
                    new (&mError) E(std::move(other.mError));
                }
            }

            Result &operator=(const Result &other)
            {
                if (this != &other)
                {
                    destroy();
                    mHasValue = other.mHasValue;
                    if (mHasValue)
                    {
                        new (&mValue) T(other.mValue);
                    }
                    else
                    {
                        new (&mError) E(other.mError);
                    }
                }

                return *this;
            }

            Result &operator=(Result &&other)
            {
                if (this != &other)
                {
                    destroy();
                    mHasValue = other.mHasValue;
                    if (mHasValue)
                    {
                        new (&mValue) T(std::move(other.mValue));
                    }
                    else
                    {
                        new (&mError) E(std::move(other.mError));
                    }
                }

                return *this;
            }

            ~Result() noexcept
            {
                destroy();
            }

            /// @brief Build a result from a value
            /// @param value Value to be copied
            /// @returns Result that contains the value
            static Result FromValue(const T &value)
            {
                return Result{ValueTag{}, value};
            }

            /// @brief Build a result from a value
            /// @param value Value to be moved
            /// @returns Result that contains the value
            static Result FromValue(T &&value)
            {
                return Result{ValueTag{}, std::move(value)};
            }

            /// @brief Build a result from an error
            /// @param error Error to be copied
            /// @returns Result that contains the error
            static Result FromError(const E &error)
            {
                return Result{ErrorTag{}, error};
            }

            /// @brief Determine whether the instance holds a value
            bool HasValue() const noexcept
            {
                return mHasValue;
            }

            explicit operator bool() const noexcept
            {
                return mHasValue;
            }

            /// @brief Access the contained value
            /// @returns Reference to the value
            /// @throws std::logic_error Throws if the result holds an error
            const T &Value() const &
            {
                if (!mHasValue)
                {
                    throw std::logic_error("Result does not contain a value.");
                }

                return mValue;
            }

            /// @brief Access the contained value
            /// @returns Reference to the value
            /// @throws std::logic_error Throws if the result holds an error
            T &Value() &
            {
                if (!mHasValue)
                {
                    throw std::logic_error("Result does not contain a value.");
                }

                return mValue;
            }

            /// @brief Access the contained error
            /// @returns Reference to the error
            /// @throws std::logic_error Throws if the result holds a value
            const E &Error() const
            {
                if (mHasValue)
                {
                    throw std::logic_error("Result does not contain an error.");
                }

                return mError;
            }

            /// @brief Get the value or a fallback
            /// @param defaultValue Value returned when the result holds an error
            /// @returns Contained value or the fallback
            template <typename U>
            T ValueOr(U &&defaultValue) const &
            {
                return mHasValue ? mValue : static_cast<T>(std::forward<U>(defaultValue));
            }
        };

        /// @brief Result specialization for operations without a value
        template <typename E>
        class Result<void, E> final
        {
        private:
            bool mHasValue;
            E *mError;

            Result() noexcept : mHasValue{true}, mError{nullptr}
            {
            }

        public:
            explicit Result(const E &error) : mHasValue{false}, mError{new E(error)}
            {
            }

            Result(const Result &other) : mHasValue{other.mHasValue},
                                          mError{other.mError == nullptr ? nullptr : new E(*other.mError)}
            {
            }

            Result(Result &&other) noexcept : mHasValue{other.mHasValue},
                                              mError{other.mError}
            {
                other.mError = nullptr;
            }

            Result &operator=(const Result &other)
            {
                if (this != &other)
                {
                    E *_copy{other.mError == nullptr ? nullptr : new E(*other.mError)};
                    delete mError;
                    mError = _copy;
                    mHasValue = other.mHasValue;
                }

                return *this;
            }

            Result &operator=(Result &&other) noexcept
            {
                if (this != &other)
                {
                    delete mError;
                    mError = other.mError;
                    mHasValue = other.mHasValue;
                    other.mError = nullptr;
                }

                return *this;
            }

            ~Result() noexcept
            {
                delete mError;
            }

            /// @brief Build a successful result
            static Result FromValue()
            {
                return Result{};
            }

            /// @brief Build a failed result
            /// @param error Error to be copied
            static Result FromError(const E &error)
            {
                return Result{error};
            }

            bool HasValue() const noexcept
            {
                return mHasValue;
            }

            explicit operator bool() const noexcept
            {
                return mHasValue;
            }

            /// @brief Access the contained error
            /// @throws std::logic_error Throws if the result is successful
            const E &Error() const
            {
                if (mHasValue || mError == nullptr)
                {
                    throw std::logic_error("Result does not contain an error.");
                }

                return *mError;
            }
        };
    }
}

#endif
