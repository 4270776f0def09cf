//----------------------------------------------------------------------------------------------------------------------
// File: VariantVisitor.hpp
// Description: Builds a visitor from a set of lambdas, one per alternative handled (i.e. the link requests of a
// drafted blueprint). A generic lambda may be given last to handle the remaining alternatives.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------

template<typename... Handlers>
struct VariantVisitor : Handlers...
{
    using Handlers::operator()...;
};

template<typename... Handlers> VariantVisitor(Handlers...) -> VariantVisitor<Handlers...>;

//----------------------------------------------------------------------------------------------------------------------
