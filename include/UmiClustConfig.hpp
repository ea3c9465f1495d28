/**
>HEADER
    Copyright (c) 2020-2024 The umiclust developers

    This file is part of umiclust.

    umiclust is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    umiclust is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with umiclust.  If not, see <http://www.gnu.org/licenses/>.
<HEADER
**/

#ifndef UMICLUST_CONFIG_HPP
#define UMICLUST_CONFIG_HPP

#include <string>

namespace umiclust {
constexpr char version[] = "0.3.1";
} // namespace umiclust

#endif // UMICLUST_CONFIG_HPP
