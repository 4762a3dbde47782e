#ifndef TODOLIST_SERVICE_TASKVIEW_HPP
#define TODOLIST_SERVICE_TASKVIEW_HPP

#include <QtGlobal>
#include <cstddef>
#include <iterator>
#include <vector>

#include "Task.hpp"

enum class TaskFilter {
    All,
    Completed,
    Pending,
};

inline bool matches(TaskFilter filter, const Task &task) {
    switch (filter) {
    case TaskFilter::All: return true;
    case TaskFilter::Completed: return task.completed;
    case TaskFilter::Pending: return !task.completed;
    }
    return false;
}

struct TaskEntry {
    qsizetype index;
    const Task &task;
};

// Lazy, filtered range over a task sequence. Nothing is copied; every begin()
// walks the sequence as it is at that moment. Must not outlive the sequence.
class TaskView {
public:
    // Input iterator: operator* yields a TaskEntry by value that refers into
    // the sequence, so there is no stable lvalue to return a reference to.
    class const_iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TaskEntry;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = TaskEntry;

        const_iterator() = default;
        const_iterator(const std::vector<Task> *tasks, TaskFilter filter, std::size_t pos)
            : m_tasks(tasks), m_filter(filter), m_pos(pos) {
            skipNonMatching();
        }

        TaskEntry operator*() const {
            return TaskEntry{static_cast<qsizetype>(m_pos), (*m_tasks)[m_pos]};
        }

        const_iterator &operator++() {
            ++m_pos;
            skipNonMatching();
            return *this;
        }

        const_iterator operator++(int) {
            const_iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const const_iterator &other) const { return m_pos == other.m_pos; }
        bool operator!=(const const_iterator &other) const { return m_pos != other.m_pos; }

    private:
        void skipNonMatching() {
            while (m_tasks && m_pos < m_tasks->size() && !matches(m_filter, (*m_tasks)[m_pos])) {
                ++m_pos;
            }
        }

        const std::vector<Task> *m_tasks = nullptr;
        TaskFilter m_filter = TaskFilter::All;
        std::size_t m_pos = 0;
    };

    TaskView(const std::vector<Task> &tasks, TaskFilter filter)
        : m_tasks(&tasks), m_filter(filter) {}

    const_iterator begin() const { return const_iterator(m_tasks, m_filter, 0); }
    const_iterator end() const { return const_iterator(m_tasks, m_filter, m_tasks->size()); }

    bool isEmpty() const { return begin() == end(); }

    qsizetype count() const {
        qsizetype n = 0;
        for (auto it = begin(); it != end(); ++it) {
            ++n;
        }
        return n;
    }

private:
    const std::vector<Task> *m_tasks;
    TaskFilter m_filter;
};

#endif // TODOLIST_SERVICE_TASKVIEW_HPP
