#pragma once

#include <cstddef>
#include <iterator>

/**
 * @brief Non-owning view over a contiguous run [begin, end) of a sequence.
 */
template <typename Iterator>
class SubRange
{
  public:
    SubRange(Iterator first, Iterator last)
        : _first(first), _last(last)
    {
    }

    Iterator begin() const
    {
        return _first;
    }

    Iterator end() const
    {
        return _last;
    }

    std::size_t size() const
    {
        return static_cast<std::size_t>(std::distance(_first, _last));
    }

    bool empty() const
    {
        return _first == _last;
    }

  private:
    Iterator _first;
    Iterator _last;
};

/**
 * @brief Lazy view over all non-empty prefixes of a sequence, smallest first.
 *
 * For a sequence of N elements the view yields N prefixes, the k-th one holding
 * the first k elements. The view can be walked backwards (largest first) through
 * rbegin()/rend() when the underlying iterator is bidirectional. It never copies
 * elements and stays valid as long as the underlying sequence is alive and unmodified.
 */
template <typename Iterator>
class PrefixRange
{
  public:
    class iterator
    {
      public:
        using iterator_category = std::bidirectional_iterator_tag;
        using value_type = SubRange<Iterator>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = SubRange<Iterator>;

        iterator() = default;

        /**
         * @param[in] first Start of the underlying sequence
         * @param[in] lastIncluded Last element of the current prefix, or the sequence end for a past-the-end iterator
         */
        iterator(Iterator first, Iterator lastIncluded)
            : _first(first), _lastIncluded(lastIncluded)
        {
        }

        reference operator*() const
        {
            return SubRange<Iterator>(_first, std::next(_lastIncluded));
        }

        iterator& operator++()
        {
            ++_lastIncluded;
            return *this;
        }

        iterator operator++(int)
        {
            iterator previous = *this;
            ++_lastIncluded;
            return previous;
        }

        iterator& operator--()
        {
            --_lastIncluded;
            return *this;
        }

        iterator operator--(int)
        {
            iterator previous = *this;
            --_lastIncluded;
            return previous;
        }

        bool operator==(const iterator& other) const
        {
            return _lastIncluded == other._lastIncluded;
        }

        bool operator!=(const iterator& other) const
        {
            return _lastIncluded != other._lastIncluded;
        }

      private:
        Iterator _first{};
        Iterator _lastIncluded{};
    };

    using const_iterator = iterator;
    using reverse_iterator = std::reverse_iterator<iterator>;

    PrefixRange(Iterator first, Iterator last)
        : _first(first), _last(last)
    {
    }

    iterator begin() const
    {
        return iterator(_first, _first);
    }

    iterator end() const
    {
        return iterator(_first, _last);
    }

    reverse_iterator rbegin() const
    {
        return reverse_iterator(end());
    }

    reverse_iterator rend() const
    {
        return reverse_iterator(begin());
    }

    std::size_t size() const
    {
        return static_cast<std::size_t>(std::distance(_first, _last));
    }

    bool empty() const
    {
        return _first == _last;
    }

  private:
    Iterator _first;
    Iterator _last;
};

/**
 * @brief Create a view over all prefixes of a container, smallest first.
 *
 * @param[in] sequence Container or array to take prefixes of, must outlive the returned view
 * @return Prefix view over the sequence
 */
template <typename Sequence>
auto IterPrefixes(const Sequence& sequence) -> PrefixRange<decltype(std::cbegin(sequence))>
{
    return PrefixRange<decltype(std::cbegin(sequence))>(std::cbegin(sequence), std::cend(sequence));
}

template <typename Sequence>
void IterPrefixes(const Sequence&& sequence) = delete;
