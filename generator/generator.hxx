#pragma once

#include "common.hxx"

#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>


namespace treewalk
{

//
// Lazy, finite, non-restartable sequence produced by a coroutine.
// The coroutine body runs only as far as the consumer pulls; once the
// body has finished, every further pull reports the end of the sequence.
//
template <typename _ValueType>
struct generator
{
    using value_type = _ValueType;

    struct promise_type
    {
        static constexpr std::size_t Empty = 0;
        static constexpr std::size_t Value = 1;
        static constexpr std::size_t Exception = 2;

        using handle = std::coroutine_handle<promise_type>;

        std::variant<std::monostate, value_type, std::exception_ptr> value;

        // Delegation chain. The consumer always resumes root_->leaf_, the
        // innermost generator currently producing values; a finished
        // nested generator hands control back to parent_.
        promise_type* root_ = this;
        promise_type* parent_ = nullptr;
        promise_type* leaf_ = this;

        struct final_awaiter
        {
            bool await_ready() noexcept
            {
                return false;
            }

            std::coroutine_handle<> await_suspend(handle h) noexcept
            {
                auto& self = h.promise();
                if (!self.parent_)
                    return std::noop_coroutine();

                self.root_->leaf_ = self.parent_;
                return handle::from_promise(*self.parent_);
            }

            void await_resume() noexcept
            {
            }
        };

        // Owns the nested generator for as long as the parent is suspended
        // on it.
        struct [[nodiscard]] nested_awaiter
        {
            explicit nested_awaiter(handle child) noexcept
                : child_(child)
            {
            }

            ~nested_awaiter()
            {
                if (child_)
                    child_.destroy();
            }

            nested_awaiter(const nested_awaiter&) = delete;
            nested_awaiter& operator=(const nested_awaiter&) = delete;

            bool await_ready() noexcept
            {
                return !child_ || child_.done();
            }

            std::coroutine_handle<> await_suspend(handle h) noexcept
            {
                auto& parent = h.promise();
                auto& child = child_.promise();

                child.root_ = parent.root_;
                child.parent_ = &parent;
                parent.root_->leaf_ = &child;

                return child_;
            }

            void await_resume()
            {
                if (!child_)
                    return;

                if (auto err = std::get_if<Exception>(&child_.promise().value); err != nullptr)
                    std::rethrow_exception(*err);
            }

        private:
            handle child_;
        };

        generator get_return_object()
        {
            return generator(handle::from_promise(*this));
        }

        std::suspend_always initial_suspend() noexcept
        {
            return {};
        }

        final_awaiter final_suspend() noexcept
        {
            return {};
        }

        void return_void()
        {
            value.template emplace<Empty>();
        }

        std::suspend_always yield_value(value_type&& v)
        {
            value.template emplace<Value>(std::move(v));
            return {};
        }

        std::suspend_always yield_value(const value_type& v)
        {
            value.template emplace<Value>(v);
            return {};
        }

        // co_yield of a whole generator: its elements are passed straight
        // to the consumer, whatever the nesting depth
        nested_awaiter yield_value(generator&& nested) noexcept
        {
            return nested_awaiter{ std::exchange(nested.handle_, nullptr) };
        }

        void unhandled_exception()
        {
            Verbose("generator::promise_type::unhandled_exception()");

            value.template emplace<Exception>(std::current_exception());
        }
    };

    using handle = std::coroutine_handle<promise_type>;

    ~generator()
    {
        if (handle_)
            handle_.destroy();
    }

    generator() noexcept
        : handle_(nullptr)
    {
    }

    explicit generator(handle h) noexcept
        : handle_(h)
    {
        Verbose("generator::generator({})", fmt::ptr(h.address()));
    }

    generator(const generator&) = delete;
    generator& operator=(const generator&) = delete;

    generator(generator&& o) noexcept
        : generator()
    {
        swap(o);
    }

    generator& operator=(generator&& o) noexcept
    {
        generator tmp(std::move(o));
        swap(tmp);
        return *this;
    }

    void swap(generator& o) noexcept
    {
        using std::swap;
        swap(handle_, o.handle_);
    }

    // Resumes the innermost active body up to its next co_yield. Returns
    // null at the end of the sequence; an exception escaping the body is
    // rethrown here.
    value_type* next()
    {
        if (!handle_ || handle_.done())
            return nullptr;

        auto& root = handle_.promise();
        handle::from_promise(*root.leaf_).resume();

        if (handle_.done())
        {
            if (auto err = std::get_if<promise_type::Exception>(&root.value); err != nullptr)
            {
                auto e = *err;
                root.value.template emplace<promise_type::Empty>();
                std::rethrow_exception(e);
            }

            return nullptr;
        }

        return std::get_if<promise_type::Value>(&root.leaf_->value);
    }

    struct iterator
    {
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = _ValueType;
        using reference = std::add_lvalue_reference_t<value_type>;
        using pointer = value_type*;

        [[nodiscard]] bool operator==(const iterator& other) const noexcept
        {
            return value_ == other.value_;
        }

        iterator& operator++()
        {
            assert(owner_);

            value_ = owner_->next();
            if (!value_)
                owner_ = nullptr; // at end()

            return *this;
        }

        void operator++(int)
        {
            ++*this;
        }

        reference operator*() const noexcept
        {
            assert(value_);
            return *value_;
        }

        pointer operator->() const noexcept
        {
            return value_;
        }

    private:
        friend struct generator;

        constexpr iterator() noexcept = default;

        explicit iterator(generator* owner)
            : owner_(owner)
            , value_(owner->next())
        {
            if (!value_)
                owner_ = nullptr;
        }

        generator* owner_ = nullptr;
        value_type* value_ = nullptr;
    };

    // Pulls the first element; calling it again continues where the
    // previous iteration stopped, it never restarts the sequence.
    iterator begin()
    {
        return iterator{ this };
    }

    constexpr iterator end() noexcept
    {
        return iterator{};
    }

private:
    handle handle_;
};


template <typename _ValueType>
std::vector<_ValueType> collect(generator<_ValueType>&& source)
{
    std::vector<_ValueType> out;

    while (auto x = source.next())
        out.push_back(std::move(*x));

    return out;
}


} // namespace treewalk {}
