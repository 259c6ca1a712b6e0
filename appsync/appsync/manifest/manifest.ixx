namespace appsync
{
  template <typename S>
  inline const typename basic_manifest<S>::file_type* basic_manifest<S>::
  find (const string_type& p) const
  {
    for (const auto& f: files)
    {
      if (f.path == p)
        return &f;
    }

    return nullptr;
  }

  template <typename S>
  inline typename basic_manifest<S>::string_type basic_manifest<S>::
  string () const
  {
    return string_type (serialize_sorted (json ()));
  }
}
