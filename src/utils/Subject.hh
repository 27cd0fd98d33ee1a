#ifndef SUBJECT_HH
#define SUBJECT_HH

#include <algorithm>
#include <cassert>
#include <vector>

namespace gbcore {

/** Receives a notification each time the observed subject changes. */
template<typename T> class Observer
{
public:
	Observer(const Observer&) = delete;
	Observer& operator=(const Observer&) = delete;

	virtual void update(const T& subject) noexcept = 0;

protected:
	Observer() = default;
	~Observer() = default;
};

/**
 * Generic Gang-of-Four Subject class of the Observer pattern, templatized
 * edition.
 * Observers must detach before the subject is destroyed, and must not
 * attach or detach from within update().
 */
template<typename T> class Subject
{
public:
	void attach(Observer<T>& observer);
	void detach(Observer<T>& observer);

protected:
	Subject() = default;
	~Subject();
	void notify() const;

private:
	std::vector<Observer<T>*> observers; // unordered
	mutable bool notifying = false;
};

template<typename T> Subject<T>::~Subject()
{
	assert(!notifying);
	assert(observers.empty());
}

template<typename T> void Subject<T>::attach(Observer<T>& observer)
{
	assert(!notifying);
	observers.push_back(&observer);
}

template<typename T> void Subject<T>::detach(Observer<T>& observer)
{
	assert(!notifying);
	auto it = std::find(observers.begin(), observers.end(), &observer);
	assert(it != observers.end());
	*it = observers.back();
	observers.pop_back();
}

template<typename T> void Subject<T>::notify() const
{
	assert(!notifying);
	notifying = true;
	for (auto* o : observers) {
		o->update(*static_cast<const T*>(this));
	}
	notifying = false;
}

} // namespace gbcore

#endif
