#include "ComponentCollection.hpp"





////////////////////////////////////////////////////////////////////////////////
// ComponentCollection:

void ComponentCollection::addComponent(ComponentCollection::EKind aKind, ComponentCollection::ComponentBasePtr aComponent)
{
	if (aComponent == nullptr)
	{
		throw LogicError("Cannot add an empty component of kind %1", aKind);
	}
	auto itr = mComponents.find(aKind);
	if (itr != mComponents.end())
	{
		throw LogicError("Duplicate component in collection: %1", aKind);
	}
	mComponents[aKind] = aComponent;
}





ComponentCollection::ComponentBasePtr ComponentCollection::get(ComponentCollection::EKind aKind) const
{
	auto itr = mComponents.find(aKind);
	if (itr != mComponents.end())
	{
		return itr->second;
	}
	return nullptr;
}
