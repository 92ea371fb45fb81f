#pragma once

/*
  Step value to the next value in [0, limit_value), wrapping
  around at either end; T is an integer or enumeration type.
 */
template<typename T>
void
cycle_value(T &value, bool decrement, unsigned int limit_value)
{
  unsigned int v(static_cast<unsigned int>(value));

  if (limit_value == 0)
    {
      return;
    }

  v = (decrement) ?
    (v + limit_value - 1) % limit_value :
    (v + 1) % limit_value;
  value = static_cast<T>(v);
}
