#include "list_error.hh"

char const* bc::to_string(list_error e)
{
    switch (e)
    {
    case list_error::list_full:
        return "the list is full";
    }

    return "<invalid bc::list_error>";
}
