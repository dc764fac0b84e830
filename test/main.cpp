//
// Created by moinshaikh on 3/8/26.
//

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include<doctest/doctest.h>
