#ifndef COMPONENTCOLLECTION_H
#define COMPONENTCOLLECTION_H





#include <memory>
#include <map>
#include "Exception.hpp"





/** A collection of the long-lived pipeline objects, so that they don't need to be pushed around in parameters.
The collection is built upon app startup (or test setup) and is expected not to change after its initial build.
There is no process-wide instance; each collection is an independent isolation domain, so tests
can build their own with fake components.

Usage:
At app start:
ComponentCollection cc;
cc.addNew<RateLimiter>();
...

In regular operation:
auto limiter = mComponents.get<RateLimiter>();
*/
class ComponentCollection
{
public:

	/** Specifies the kind of the individual component. */
	enum EKind
	{
		ckInstallConfiguration,
		ckRateLimiter,
		ckCircuitBreaker,
		ckMetricsTracker,
		ckLookupCache,
		ckTagWriter,
	};


protected:

	/** An internal base for all components, that keeps track of the component kind. */
	class ComponentBase
	{
		friend class ::ComponentCollection;
	public:
		ComponentBase(EKind aKind):
			mKind(aKind)
		{
		}

		virtual ~ComponentBase() {}


	protected:
		EKind mKind;
	};

	using ComponentBasePtr = std::shared_ptr<ComponentBase>;


public:

	/** A base class representing the common functionality in all components in the collection. */
	template <EKind tKind>
	class Component:
		public ComponentBase
	{
	public:
		Component():
			ComponentBase(tKind)
		{
		}

		static EKind kind() { return tKind; }
	};



	/** Adds the specified component into the collection.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass>
	void addComponent(std::shared_ptr<ComponentClass> aComponent)
	{
		addComponent(ComponentClass::kind(), aComponent);
	}


	/** Creates a new component of the specified template type,
	adds it to the collection and returns a shared ptr to it.
	Throws a LogicError if a component of the same kind already exists. */
	template <typename ComponentClass, typename... Args>
	std::shared_ptr<ComponentClass> addNew(Args &&... aArgs)
	{
		auto res = std::make_shared<ComponentClass>(std::forward<Args>(aArgs)...);
		addComponent(ComponentClass::kind(), res);
		return res;
	}


	/** Returns the component of the specified class, or nullptr if not present.
	Usage: auto limiter = mComponents.get<RateLimiter>(); */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> get() const
	{
		return std::dynamic_pointer_cast<ComponentClass>(get(ComponentClass::kind()));
	}


	/** Returns the component of the specified class.
	Throws a LogicError if the component is not present; use for components the caller cannot work without. */
	template <typename ComponentClass>
	std::shared_ptr<ComponentClass> require() const
	{
		auto res = get<ComponentClass>();
		if (res == nullptr)
		{
			throw LogicError("Required component %1 is not present in the collection", ComponentClass::kind());
		}
		return res;
	}


protected:

	/** The collection of all components. */
	std::map<EKind, ComponentBasePtr> mComponents;


	/** Adds the specified component into the collection.
	Throws a LogicError if a component of the same kind already exists.
	Client code should use the templated version, this is its actual implementation. */
	void addComponent(EKind aKind, ComponentBasePtr aComponent);

	/** Returns the component of the specified kind, as a base pointer, or nullptr if not present.
	Clients should use the templated get() instead (which calls this internally). */
	ComponentBasePtr get(EKind aKind) const;
};





#endif // COMPONENTCOLLECTION_H
